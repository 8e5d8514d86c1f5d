#include "tests/tests.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_captioner/style_options.hpp"
#include "lib_utils/log.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

json::Value settings(std::string const& text) {
	return json::parse(text);
}

unittest("normalizeStyleOptions: defaults") {
	auto opt = normalizeStyleOptions(settings("{}"), getNullLog());
	ASSERT_EQUALS("Arial", opt.fontFamily);
	ASSERT_EQUALS(0.0, opt.fontSize);
	ASSERT_EQUALS("#FFFFFF", opt.lineColor);
	ASSERT_EQUALS("#FFFF00", opt.wordColor);
	ASSERT_EQUALS("#000000", opt.backColor);
	ASSERT_EQUALS("#000000", opt.outlineColor);
	ASSERT(!opt.bold && !opt.italic && !opt.underline && !opt.strikeout);
	ASSERT_EQUALS("100", opt.scaleX);
	ASSERT_EQUALS("2", opt.outlineWidth);
	ASSERT_EQUALS("20", opt.marginV);
	ASSERT_EQUALS(1, opt.borderStyle);
	ASSERT(!opt.box);
	ASSERT_EQUALS("middle_center", opt.position);
	ASSERT_EQUALS("center", opt.alignment);
	ASSERT(opt.explicitX() == nullptr && opt.explicitY() == nullptr);
	ASSERT_EQUALS(0, opt.maxWordsPerLine);
	ASSERT_EQUALS("classic", opt.style);
}

unittest("normalizeStyleOptions: hyphenated keys") {
	auto opt = normalizeStyleOptions(settings(R"({ "font-family": "DejaVu Sans", "max-words-per-line": 3, "all-caps": true, "margin-v": 40 })"), getNullLog());
	ASSERT_EQUALS("DejaVu Sans", opt.fontFamily);
	ASSERT_EQUALS(3, opt.maxWordsPerLine);
	ASSERT(opt.allCaps);
	ASSERT_EQUALS("40", opt.marginV);
}

unittest("normalizeStyleOptions: highlight_color is merged into word_color") {
	auto opt = normalizeStyleOptions(settings(R"({ "word_color": "#00FF00", "highlight-color": "#FF00FF" })"), getNullLog());
	ASSERT_EQUALS("#FF00FF", opt.wordColor);
}

unittest("normalizeStyleOptions: back_color wins over box_color") {
	auto opt = normalizeStyleOptions(settings(R"({ "box_color": "#111111", "back_color": "#222222" })"), getNullLog());
	ASSERT_EQUALS("#222222", opt.backColor);

	opt = normalizeStyleOptions(settings(R"({ "box_color": "#111111" })"), getNullLog());
	ASSERT_EQUALS("#111111", opt.backColor);

	opt = normalizeStyleOptions(settings(R"({ "box_color": "#111111", "back_color": "" })"), getNullLog());
	ASSERT_EQUALS("#111111", opt.backColor);
}

unittest("normalizeStyleOptions: typed values") {
	auto opt = normalizeStyleOptions(settings(R"({
		"font_size": 36.5, "bold": "true", "italic": 1, "box": true,
		"scale_x": "120", "angle": 12.5, "border_style": 3,
		"x": 100, "y": "50.5", "style": "Karaoke"
	})"), getNullLog());
	ASSERT(near(36.5, opt.fontSize));
	ASSERT(opt.bold);
	ASSERT(opt.italic);
	ASSERT(opt.box);
	ASSERT_EQUALS("120", opt.scaleX);
	ASSERT_EQUALS("12.5", opt.angle);
	ASSERT_EQUALS(3, opt.borderStyle);
	ASSERT(opt.explicitX() && near(100, *opt.explicitX()));
	ASSERT(opt.explicitY() && near(50.5, *opt.explicitY()));
	ASSERT_EQUALS("karaoke", opt.style);
}

unittest("normalizeStyleOptions: null values keep the defaults") {
	auto opt = normalizeStyleOptions(settings(R"({ "x": null, "font_size": null })"), getNullLog());
	ASSERT(opt.explicitX() == nullptr);
	ASSERT_EQUALS(0.0, opt.fontSize);
}

unittest("normalizeStyleOptions: wrong types are rejected") {
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "font_family": 12 })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "bold": "maybe" })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "max_words_per_line": "two" })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "max_words_per_line": 2.5 })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "scale_x": [100] })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "font_size": -3 })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "font_family": " " })"), getNullLog()));

	try {
		normalizeStyleOptions(settings(R"({ "line_color": true })"), getNullLog());
		ASSERT(0);
	} catch (ValidationError const& e) {
		ASSERT_EQUALS("Setting 'line_color' must be a string.", std::string(e.what()));
	}
}

unittest("normalizeStyleOptions: integers out of range are rejected") {
	try {
		normalizeStyleOptions(settings(R"({ "max_words_per_line": 1e12 })"), getNullLog());
		ASSERT(0);
	} catch (ValidationError const& e) {
		ASSERT_EQUALS("Setting 'max_words_per_line' is out of range.", std::string(e.what()));
	}
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "border_style": -3000000000 })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "x": 1e12, "y": 10 })"), getNullLog()));
	ASSERT_THROWN(normalizeStyleOptions(settings(R"({ "x": 10, "y": "-1e12" })"), getNullLog()));

	auto const opt = normalizeStyleOptions(settings(R"({ "max_words_per_line": 2147483647, "x": -2147483648.5 })"), getNullLog());
	ASSERT_EQUALS(2147483647, opt.maxWordsPerLine);
	ASSERT(opt.hasX);
}

unittest("normalizeStyleOptions: settings must be an object") {
	auto doc = json::parse(R"({ "settings": [1, 2] })");
	try {
		normalizeStyleOptions(doc["settings"], getNullLog());
		ASSERT(0);
	} catch (ValidationError const& e) {
		ASSERT_EQUALS("'settings' should be a dictionary.", std::string(e.what()));
	}
}

unittest("normalizeStyleOptions: unknown keys are ignored") {
	auto opt = normalizeStyleOptions(settings(R"({ "sparkles": true, "bold": true })"), getNullLog());
	ASSERT(opt.bold);
}

unittest("withDefaultFontSize") {
	StyleOptions opt;
	ASSERT(near(54, withDefaultFontSize(opt, 1080).fontSize));
	ASSERT(near(14, withDefaultFontSize(opt, 288).fontSize));
	opt.fontSize = 20;
	ASSERT(near(20, withDefaultFontSize(opt, 1080).fontSize));
}

unittest("parseStyle: unknown names fall back to classic") {
	ASSERT(Style::Karaoke == parseStyle("karaoke", getNullLog()));
	ASSERT(Style::WordByWord == parseStyle("Word_By_Word", getNullLog()));
	ASSERT(Style::Classic == parseStyle("fancy", getNullLog()));
	ASSERT_EQUALS("highlight", std::string(styleName(Style::Highlight)));
}

unittest("normalizeReplaceRules") {
	auto doc = json::parse(R"({ "replace": [
		{ "find": "gonna", "replace": "going to" },
		{ "find": "x" },
		"junk",
		{ "find": "", "replace": "y" },
		{ "find": "GONNA", "replace": "will" },
		{ "find": "gonna", "replace": "shall" }
	] })");
	auto dict = normalizeReplaceRules(doc["replace"], getNullLog());
	ASSERT_EQUALS(2u, dict.size());
	ASSERT_EQUALS("gonna", dict.pairs[0].key);
	ASSERT_EQUALS("shall", dict.pairs[0].value);
	ASSERT_EQUALS("GONNA", dict.pairs[1].key);
}

unittest("normalizeReplaceRules: must be a list") {
	auto doc = json::parse(R"({ "replace": { "find": "a", "replace": "b" } })");
	ASSERT_THROWN(normalizeReplaceRules(doc["replace"], getNullLog()));
}

unittest("formatNumber") {
	ASSERT_EQUALS("54", formatNumber(54));
	ASSERT_EQUALS("36.5", formatNumber(36.5));
	ASSERT_EQUALS("-2", formatNumber(-2));
}

}
