#include "time_codec.hpp"
#include "errors.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace Captioner {

long long roundHalfEven(double value) {
	auto const lower = std::floor(value);
	auto const diff = value - lower;
	if (diff > 0.5)
		return (long long)lower + 1;
	if (diff < 0.5)
		return (long long)lower;
	auto const l = (long long)lower;
	return (l % 2 == 0) ? l : l + 1;
}

std::string formatAssTime(double seconds) {
	if (!(seconds > 0))
		seconds = 0;

	auto wholeSeconds = (long long)std::floor(seconds);
	auto centiseconds = roundHalfEven((seconds - (double)wholeSeconds) * 100);
	if (centiseconds >= 100) {
		wholeSeconds += centiseconds / 100;
		centiseconds %= 100;
	}

	auto const hours = wholeSeconds / 3600;
	auto const minutes = (wholeSeconds % 3600) / 60;
	auto const secs = wholeSeconds % 60;

	char buffer[64];
	snprintf(buffer, sizeof buffer, "%lld:%02lld:%02lld.%02lld", hours, minutes, secs, centiseconds);
	return buffer;
}

bool tryParseAssTime(std::string const& text, double& seconds) {
	int h = 0, m = 0, s = 0, cs = 0;
	char trailing = 0;
	auto const t = trim(text);
	if (sscanf(t.c_str(), "%d:%d:%d.%d%c", &h, &m, &s, &cs, &trailing) != 4)
		return false;
	if (h < 0 || m < 0 || s < 0 || cs < 0)
		return false;
	seconds = h * 3600.0 + m * 60.0 + s + cs / 100.0;
	return true;
}

double parseAssTime(std::string const& text) {
	double seconds = 0;
	if (!tryParseAssTime(text, seconds))
		throw FormatError(format("Invalid ASS time: '%s'", text));
	return seconds;
}

double parseTimeString(std::string const& text) {
	static const std::regex pattern(R"(^(?:(\d+):)?(\d{1,2}):(\d{2}(?:\.\d{1,3})?)$)");

	std::smatch match;
	if (std::regex_match(text, match, pattern)) {
		auto const hours = match[1].matched ? atoll(match[1].str().c_str()) : 0;
		auto const minutes = atoll(match[2].str().c_str());
		auto const secs = strtod(match[3].str().c_str(), nullptr);
		return hours * 3600.0 + minutes * 60.0 + secs;
	}

	// bare seconds
	auto const t = trim(text);
	if (!t.empty()) {
		char* end = nullptr;
		auto const value = strtod(t.c_str(), &end);
		if (end == t.c_str() + t.size() && std::isfinite(value))
			return value;
	}

	throw ValidationError(format("Invalid time string: %s", text));
}

std::string formatSrtTime(double seconds) {
	if (!(seconds > 0))
		seconds = 0;

	auto const totalMs = (long long)std::llround(seconds * 1000);
	char buffer[64];
	snprintf(buffer, sizeof buffer, "%02lld:%02lld:%02lld,%03lld",
	    totalMs / 3600000, (totalMs / 60000) % 60, (totalMs / 1000) % 60, totalMs % 1000);
	return buffer;
}

bool tryParseSrtTime(std::string const& text, double& seconds) {
	static const std::regex pattern(R"(^\s*(\d+):(\d+):(\d+)[,.:](\d+)\s*$)");

	std::smatch match;
	if (!std::regex_match(text, match, pattern))
		return false;

	seconds = atoll(match[1].str().c_str()) * 3600.0
	    + atoll(match[2].str().c_str()) * 60.0
	    + atoll(match[3].str().c_str())
	    + atoll(match[4].str().c_str()) / 1000.0;
	return true;
}

double parseSrtTime(std::string const& text) {
	double seconds = 0;
	if (!tryParseSrtTime(text, seconds))
		throw FormatError(format("Invalid SRT time: '%s'", text));
	return seconds;
}

}
