#include "tests/tests.hpp"
#include "lib_captioner/style_handlers.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/tools.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

const char* const Pos = "{\\an5\\pos(960,540)}";
const char* const White = "{\\c&H00FFFFFF}";
const char* const Yellow = "{\\c&H0000FFFF}";

Resolution fullHd() {
	Resolution r;
	r.width = 1920;
	r.height = 1080;
	return r;
}

TranscriptionResult helloWorld() {
	TranscriptionResult t;
	t.segments.push_back(segment(0, 1, "Hello world", { word("Hello", 0, 0.5), word("world", 0.5, 1) }));
	return t;
}

std::vector<std::string> render(Style style, TranscriptionResult const& t, StyleOptions const& opt = StyleOptions(), ReplaceDict const& dict = ReplaceDict()) {
	auto const text = renderDialogues(style, t, opt, dict, fullHd(), getNullLog());
	if (text.empty())
		return {};
	return split(text, '\n');
}

std::string dialogue(int layer, const char* start, const char* end, std::string const& rest) {
	return std::string("Dialogue: ") + std::to_string(layer) + "," + start + "," + end + ",Default,,0,0,0,," + Pos + rest;
}

unittest("DialogueEvent: serialization") {
	DialogueEvent e;
	e.layer = 1;
	e.start = "0:00:01.00";
	e.end = "0:00:02.50";
	e.positionTag = "{\\an2\\pos(10,20)}";
	e.colorOverrides = "{\\c&H00FFFFFF}";
	e.text = "Hi";
	ASSERT_EQUALS("Dialogue: 1,0:00:01.00,0:00:02.50,Default,,0,0,0,,{\\an2\\pos(10,20)}{\\c&H00FFFFFF}Hi", e.toString());
}

unittest("style handlers: classic") {
	TranscriptionResult t;
	t.segments.push_back(segment(1.5, 3.25, "  one two\nthree  "));

	StyleOptions opt;
	opt.allCaps = true;
	opt.maxWordsPerLine = 2;

	ASSERT_EQUALS(std::vector<std::string>({ dialogue(0, "0:00:01.50", "0:00:03.25", "ONE TWO\\NTHREE") }), render(Style::Classic, t, opt));
}

unittest("style handlers: classic applies the replacements") {
	TranscriptionResult t;
	t.segments.push_back(segment(0, 2, "Um, hello"));
	ReplaceDict dict;
	dict["um, "] = "";

	ASSERT_EQUALS(std::vector<std::string>({ dialogue(0, "0:00:00.00", "0:00:02.00", "hello") }), render(Style::Classic, t, StyleOptions(), dict));
}

unittest("style handlers: karaoke") {
	TranscriptionResult t;
	t.segments.push_back(segment(0, 1, "Hello world", { word("Hello", 0, 0.25), word("world", 0.25, 0.75) }));
	t.segments.push_back(segment(2, 3, "no words"));

	ASSERT_EQUALS(std::vector<std::string>({ dialogue(0, "0:00:00.00", "0:00:00.75", std::string(Yellow) + "{\\k25}Hello {\\k50}world") }),
	    render(Style::Karaoke, t));
}

unittest("style handlers: karaoke line splitting") {
	TranscriptionResult t;
	t.segments.push_back(segment(0, 3, "a b c", { word("a", 0, 1), word("b", 1, 2), word("c", 2, 3) }));
	StyleOptions opt;
	opt.maxWordsPerLine = 2;

	ASSERT_EQUALS(std::vector<std::string>({ dialogue(0, "0:00:00.00", "0:00:03.00", std::string(Yellow) + "{\\k100}a {\\k100}b\\N{\\k100}c") }),
	    render(Style::Karaoke, t, opt));
}

unittest("style handlers: highlight") {
	auto const expected = std::vector<std::string>({
		dialogue(0, "0:00:00.00", "0:00:01.00", std::string(White) + "Hello world"),
		dialogue(1, "0:00:00.00", "0:00:00.50", std::string(White) + Yellow + "Hello" + White + " world"),
		dialogue(1, "0:00:00.50", "0:00:01.00", std::string(White) + "Hello " + Yellow + "world" + White),
	});
	ASSERT_EQUALS(expected, render(Style::Highlight, helloWorld()));
}

unittest("style handlers: highlight with line splitting") {
	TranscriptionResult t;
	t.segments.push_back(segment(0, 3, "a b c", { word("a", 0, 1), word("b", 1, 2), word("c", 2, 3) }));
	StyleOptions opt;
	opt.maxWordsPerLine = 2;

	auto const lines = render(Style::Highlight, t, opt);
	ASSERT_EQUALS(5u, lines.size());
	ASSERT_EQUALS(dialogue(0, "0:00:02.00", "0:00:03.00", std::string(White) + "c"), lines[3]);
}

unittest("style handlers: underline") {
	auto const expected = std::vector<std::string>({
		dialogue(0, "0:00:00.00", "0:00:00.50", std::string(White) + "{\\u1}Hello{\\u0} world"),
		dialogue(0, "0:00:00.50", "0:00:01.00", std::string(White) + "Hello {\\u1}world{\\u0}"),
	});
	ASSERT_EQUALS(expected, render(Style::Underline, helloWorld()));
}

unittest("style handlers: word by word") {
	StyleOptions opt;
	opt.allCaps = true;
	opt.wordColor = "#00FF00";

	auto const expected = std::vector<std::string>({
		dialogue(0, "0:00:00.00", "0:00:00.50", "{\\c&H0000FF00}HELLO"),
		dialogue(0, "0:00:00.50", "0:00:01.00", "{\\c&H0000FF00}WORLD"),
	});
	ASSERT_EQUALS(expected, render(Style::WordByWord, helloWorld(), opt));
}

unittest("style handlers: words emptied by the replacements are dropped") {
	ReplaceDict dict;
	dict["hello"] = "";
	auto const lines = render(Style::WordByWord, helloWorld(), StyleOptions(), dict);
	ASSERT_EQUALS(1u, lines.size());
	ASSERT_EQUALS(dialogue(0, "0:00:00.50", "0:00:01.00", std::string(Yellow) + "world"), lines[0]);
}

unittest("style handlers: no segments") {
	ASSERT_EQUALS("", renderDialogues(Style::Highlight, TranscriptionResult(), StyleOptions(), ReplaceDict(), fullHd(), getNullLog()));
}

unittest("style handlers: explicit position") {
	StyleOptions opt;
	opt.hasX = opt.hasY = true;
	opt.x = 100.7;
	opt.y = 200;
	opt.alignment = "left";

	auto const text = renderDialogues(Style::Classic, helloWorld(), opt, ReplaceDict(), fullHd(), getNullLog());
	ASSERT_EQUALS("Dialogue: 0,0:00:00.00,0:00:01.00,Default,,0,0,0,,{\\an4\\pos(100,200)}Hello world", text);
}

unittest("style handlers: handler lookup") {
	ASSERT(getStyleHandler(Style::Classic) == &renderClassic);
	ASSERT(getStyleHandler(Style::Karaoke) == &renderKaraoke);
	ASSERT(getStyleHandler(Style::Highlight) == &renderHighlight);
	ASSERT(getStyleHandler(Style::Underline) == &renderUnderline);
	ASSERT(getStyleHandler(Style::WordByWord) == &renderWordByWord);
	ASSERT(getStyleHandler(parseStyle("unknown", getNullLog())) == &renderClassic);
}

}
