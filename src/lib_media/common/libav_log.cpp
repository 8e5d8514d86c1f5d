#include "libav.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/format.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace {

Level avLogLevel(int level) {
	switch (level) {
	case AV_LOG_QUIET:
	case AV_LOG_PANIC:
	case AV_LOG_FATAL:
		return Error;
	case AV_LOG_ERROR:
	case AV_LOG_WARNING:
		return Warning;
	case AV_LOG_INFO:
	case AV_LOG_VERBOSE:
		return Debug;
	default:
		return Quiet;
	}
}

void avLog(void* /*avcl*/, int level, const char *fmt, va_list vl) {
	auto const logLevel = avLogLevel(level);
	if (logLevel == Quiet)
		return;

	char buffer[1280];
	vsnprintf(buffer, sizeof(buffer)-1, fmt, vl);

	// remove trailing end of line
	{
		auto const N = strlen(buffer);
		if (N > 0 && buffer[N-1] == '\n')
			buffer[N-1] = 0;
	}
	g_Log->log(logLevel, format("[libav] %s", buffer).c_str());
}

}

std::string avStrError(int err) {
	char buffer[256] {};
	av_strerror(err, buffer, sizeof buffer);
	return buffer;
}

void setupLibavLogging() {
	static auto const done = []() {
		av_log_set_callback(&avLog);
		return true;
	}();
	(void)done;
}
