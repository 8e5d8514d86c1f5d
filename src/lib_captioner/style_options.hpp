#pragma once

#include "text.hpp" // ReplaceDict
#include "lib_utils/json.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>

namespace Captioner {

enum class Style {
	Classic,
	Karaoke,
	Highlight,
	Underline,
	WordByWord,
};

// Unknown names fall back to Style::Classic, with a warning.
Style parseStyle(std::string const& name, LogSink* log);
const char* styleName(Style style);

// Fully-typed captioning settings. Produced once per request by normalizeStyleOptions().
struct StyleOptions {
	std::string fontFamily = "Arial";
	double fontSize = 0; // 0: derived from the video height (see withDefaultFontSize())

	// "#RRGGBB"
	std::string lineColor = "#FFFFFF";
	std::string wordColor = "#FFFF00";
	std::string backColor = "#000000"; // box fill when 'box' is set, shadow otherwise
	std::string outlineColor = "#000000";

	bool bold = false;
	bool italic = false;
	bool underline = false;
	bool strikeout = false;

	// numeric fields copied verbatim into the style line
	std::string scaleX = "100";
	std::string scaleY = "100";
	std::string spacing = "0";
	std::string angle = "0";
	std::string outlineWidth = "2";
	std::string shadowOffset = "0";
	std::string marginL = "20";
	std::string marginR = "20";
	std::string marginV = "20";

	int borderStyle = 1;
	bool box = false;

	std::string position = "middle_center";
	std::string alignment = "center";
	bool hasX = false, hasY = false;
	double x = 0, y = 0;

	bool allCaps = false;
	int maxWordsPerLine = 0; // <= 0: no split

	std::string style = "classic"; // as requested, lower-cased

	double const* explicitX() const {
		return hasX ? &x : nullptr;
	}
	double const* explicitY() const {
		return hasY ? &y : nullptr;
	}
};

// 5% of the video height when no font size was requested
StyleOptions withDefaultFontSize(StyleOptions options, int videoHeight);

// Normalizes the keys of a settings object ('-' becomes '_'), merges the deprecated
// 'highlight_color' into 'word_color' and applies the defaults.
// Throws ValidationError if 'settings' isn't an object or if a value has the wrong type.
StyleOptions normalizeStyleOptions(json::Value const& settings, LogSink* log, std::string const& logPrefix = "");

// 'replace' must be an array of {"find": ..., "replace": ...} objects (ValidationError otherwise).
// Invalid items are skipped with a warning.
ReplaceDict normalizeReplaceRules(json::Value const& replace, LogSink* log, std::string const& logPrefix = "");

// integral values are written without decimals
std::string formatNumber(double value);

}
