#pragma once

#include <string>

namespace Captioner {

// "H:MM:SS.cc", hours are not padded. Negative times are clamped to zero.
std::string formatAssTime(double seconds);

// Parses "H:MM:SS.cc" as written by formatAssTime(). Throws FormatError.
double parseAssTime(std::string const& text);
bool tryParseAssTime(std::string const& text, double& seconds);

// Accepts "H:MM:SS[.ms]", "MM:SS[.ms]" or a bare number of seconds. Throws ValidationError.
double parseTimeString(std::string const& text);

// SubRip: "HH:MM:SS,mmm"
std::string formatSrtTime(double seconds);
double parseSrtTime(std::string const& text); // throws FormatError
bool tryParseSrtTime(std::string const& text, double& seconds);

// round half to even
long long roundHalfEven(double value);

}
