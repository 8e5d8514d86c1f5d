#include "srt.hpp"
#include "errors.hpp"
#include "time_codec.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

namespace {

std::string normalizeNewlines(std::string const& s) {
	std::string r;
	r.reserve(s.size());
	for (size_t i = 0; i < s.size(); ++i) {
		if (s[i] == '\r') {
			r += '\n';
			if (i + 1 < s.size() && s[i + 1] == '\n')
				++i;
		} else {
			r += s[i];
		}
	}
	return r;
}

bool isIndex(std::string const& line) {
	auto const t = trim(line);
	if (t.empty())
		return false;
	for (auto c : t)
		if (c < '0' || c > '9')
			return false;
	return true;
}

bool parseTimestampLine(std::string const& line, double& start, double& end) {
	auto const arrow = line.find("-->");
	if (arrow == std::string::npos)
		return false;
	auto const endWords = splitWords(line.substr(arrow + 3)); // coordinates may follow
	if (endWords.empty())
		return false;
	return tryParseSrtTime(line.substr(0, arrow), start) && tryParseSrtTime(endWords[0], end);
}

// blocks of consecutive non-blank lines
std::vector<std::vector<std::string>> splitBlocks(std::string const& content) {
	std::vector<std::vector<std::string>> blocks;
	std::vector<std::string> curr;
	for (auto& line : split(normalizeNewlines(content), '\n')) {
		if (trim(line).empty()) {
			if (!curr.empty())
				blocks.push_back(curr);
			curr.clear();
		} else {
			curr.push_back(line);
		}
	}
	if (!curr.empty())
		blocks.push_back(curr);
	return blocks;
}

}

std::vector<SrtEntry> parseSrt(std::string const& content) {
	std::vector<SrtEntry> entries;

	for (auto& block : splitBlocks(content)) {
		size_t i = 0;
		if (block.size() > 1 && isIndex(block[0]))
			++i;

		SrtEntry entry;
		if (!parseTimestampLine(block[i], entry.start, entry.end)) {
			if (block[i].find("-->") != std::string::npos)
				throw FormatError(format("Invalid SRT timestamp line: '%s'", block[i]));

			// a blank line inside the content of the previous block
			if (entries.empty())
				throw FormatError(format("Unexpected SRT content before the first timestamp: '%s'", block[0]));
			entries.back().content += "\n\n" + join(block, "\n");
			continue;
		}

		if (entry.end <= entry.start)
			throw FormatError(format("SRT block %s ends before it starts.", (int)entries.size() + 1));

		std::vector<std::string> lines(block.begin() + i + 1, block.end());
		entry.content = join(lines, "\n");
		entries.push_back(entry);
	}

	return entries;
}

bool isSrt(std::string const& content) {
	if (trim(content).empty())
		return false;
	try {
		return !parseSrt(content).empty();
	} catch (FormatError const&) {
		return false;
	}
}

std::string composeSrt(std::vector<SrtEntry> const& entries) {
	std::string r;
	int index = 1;
	for (auto& entry : entries) {
		// leading and trailing blank lines would end the block early
		auto lines = split(entry.content, '\n');
		while (!lines.empty() && trim(lines.back()).empty())
			lines.pop_back();
		size_t first = 0;
		while (first < lines.size() && trim(lines[first]).empty())
			++first;
		lines.erase(lines.begin(), lines.begin() + first);
		for (auto& line : lines)
			if (trim(line).empty())
				line.clear();

		r += format("%s\n%s --> %s\n", index++, formatSrtTime(entry.start), formatSrtTime(entry.end));
		r += join(lines, "\n") + "\n\n";
	}
	return r;
}

}
