#include "tests/tests.hpp"
#include "lib_captioner/text.hpp"

using namespace Captioner;

namespace {

unittest("splitLines: groups of words") {
	ASSERT_EQUALS(std::vector<std::string>({"a b", "c d", "e"}), splitLines("a b c d e", 2));
	ASSERT_EQUALS(std::vector<std::string>({"a b c"}), splitLines("  a  b c ", 3));
	ASSERT_EQUALS(std::vector<std::string>({}), splitLines("   ", 2));
}

unittest("splitLines: no split") {
	ASSERT_EQUALS(std::vector<std::string>({"  a b  "}), splitLines("  a b  ", 0));
	ASSERT_EQUALS(std::vector<std::string>({"a b"}), splitLines("a b", -1));
}

unittest("applyReplacements: case-insensitive") {
	ReplaceDict dict;
	dict["world"] = "there";
	ASSERT_EQUALS("Hello there, there!", applyReplacements("Hello World, WORLD!", dict));
}

unittest("applyReplacements: rules are applied in order") {
	ReplaceDict dict;
	dict["cat"] = "dog";
	dict["dog"] = "bird";
	ASSERT_EQUALS("bird bird", applyReplacements("cat dog", dict));
}

unittest("applyReplacements: special characters are literal") {
	ReplaceDict dict;
	dict["a.c"] = "X";
	dict["(1)"] = "[1]";
	ASSERT_EQUALS("abc X [1]", applyReplacements("abc a.c (1)", dict));
}

unittest("applyReplacements: replacement containing the pattern") {
	ReplaceDict dict;
	dict["a"] = "aa";
	ASSERT_EQUALS("baab", applyReplacements("bab", dict));
}

unittest("applyReplacements: empty pattern is skipped") {
	ReplaceDict dict;
	dict[""] = "x";
	ASSERT_EQUALS("abc", applyReplacements("abc", dict));
}

unittest("processSubtitleText: replace, then upper case, then split") {
	ReplaceDict dict;
	dict["gonna"] = "going to";
	ASSERT_EQUALS("I'M GOING\\NTO WIN", processSubtitleText("I'm gonna win", dict, true, 2));
	ASSERT_EQUALS("I'm going to win", processSubtitleText("I'm gonna win", dict, false, 0));
}

}
