#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Captioner {

// Every failure of a captioning request is reported as one of these.
struct CaptionError : std::runtime_error {
	CaptionError(std::string const& msg) : std::runtime_error(msg) {}
};

// malformed request: settings, replace list, exclude ranges, time strings
struct ValidationError : CaptionError {
	ValidationError(std::string const& msg) : CaptionError(msg) {}
};

struct FontUnavailableError : CaptionError {
	FontUnavailableError(std::string const& requested, std::vector<std::string> const& availableFonts)
		: CaptionError("Font '" + requested + "' not available."), requested(requested), availableFonts(availableFonts) {
	}
	std::string requested;
	std::vector<std::string> availableFonts;
};

// caption, video or transcript could not be obtained
struct SourceRetrievalError : CaptionError {
	SourceRetrievalError(std::string const& msg) : CaptionError(msg) {}
};

// unparsable subtitles, or a style not supported by the caption source
struct FormatError : CaptionError {
	FormatError(std::string const& msg) : CaptionError(msg) {}
};

struct PersistenceError : CaptionError {
	PersistenceError(std::string const& msg) : CaptionError(msg) {}
};

}
