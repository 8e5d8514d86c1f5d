#include "collaborators.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"
#include <cstdio>
#include <stdexcept>

namespace Captioner {

std::string download(IFilePuller* puller, std::string const& url) {
	std::string r;
	auto onBuffer = [&](SpanC buf) {
		r += toString(buf);
	};
	puller->wget(url.c_str(), onBuffer);
	return r;
}

void downloadToFile(IFilePuller* puller, std::string const& url, std::string const& path) {
	auto file = fopen(path.c_str(), "wb");
	if (!file)
		throw std::runtime_error(format("Can't open '%s' for writing", path));

	auto onBuffer = [&](SpanC buf) {
		if (fwrite(buf.ptr, 1, buf.len, file) != buf.len)
			throw std::runtime_error(format("Can't write to '%s'", path));
	};

	try {
		puller->wget(url.c_str(), onBuffer);
	} catch (std::exception const&) {
		fclose(file);
		remove(path.c_str());
		throw;
	}
	fclose(file);
}

bool isUrl(std::string const& s) {
	auto const lower = toLower(trim(s));
	return startsWith(lower, "http://") || startsWith(lower, "https://");
}

}
