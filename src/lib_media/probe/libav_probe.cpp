#include "libav_probe.hpp"
#include "../common/libav.hpp"
#include "lib_utils/format.hpp"
#include <memory>
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
}

namespace Media {

namespace {

struct FormatContextDeleter {
	void operator()(AVFormatContext* ctx) const {
		avformat_close_input(&ctx);
	}
};

typedef std::unique_ptr<AVFormatContext, FormatContextDeleter> FormatContext;

FormatContext openInput(std::string const& path) {
	AVFormatContext* ctx = nullptr;
	int err = avformat_open_input(&ctx, path.c_str(), nullptr, nullptr);
	if (err < 0)
		throw std::runtime_error(format("Error when opening input '%s': %s", path, avStrError(err)));

	FormatContext r(ctx);
	err = avformat_find_stream_info(ctx, nullptr);
	if (err < 0)
		throw std::runtime_error(format("Couldn't get additional video stream info for '%s': %s", path, avStrError(err)));
	return r;
}

}

LibavProbe::LibavProbe(LogSink* log) : m_log(log) {
	setupLibavLogging();
}

Captioner::Resolution LibavProbe::resolution(std::string const& path) {
	try {
		auto ctx = openInput(path);
		for (unsigned i = 0; i < ctx->nb_streams; ++i) {
			auto const params = ctx->streams[i]->codecpar;
			if (params->codec_type != AVMEDIA_TYPE_VIDEO || params->width <= 0 || params->height <= 0)
				continue;
			Captioner::Resolution r;
			r.width = params->width;
			r.height = params->height;
			return r;
		}
		m_log->log(Warning, format("No video stream found in '%s', using default resolution.", path).c_str());
	} catch (std::exception const& e) {
		m_log->log(Warning, format("Can't probe resolution, using default resolution: %s", e.what()).c_str());
	}
	return Captioner::Resolution();
}

bool LibavProbe::duration(std::string const& path, double& seconds) {
	try {
		auto ctx = openInput(path);
		if (ctx->duration == AV_NOPTS_VALUE || ctx->duration <= 0) {
			m_log->log(Warning, format("Could not determine video duration of '%s'.", path).c_str());
			return false;
		}
		seconds = (double)ctx->duration / AV_TIME_BASE;
		return true;
	} catch (std::exception const& e) {
		m_log->log(Warning, format("Could not determine video duration: %s", e.what()).c_str());
		return false;
	}
}

}
