#include "tests/tests.hpp"
#include "lib_captioner/srt.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

const char* const sample =
    "1\n"
    "00:00:01,000 --> 00:00:03,500\n"
    "Hello world\n"
    "\n"
    "2\n"
    "00:00:04,000 --> 00:00:06,000\n"
    "Second line\n"
    "on two lines\n";

unittest("parseSrt: blocks") {
	auto entries = parseSrt(sample);
	ASSERT_EQUALS(2u, entries.size());
	ASSERT(near(1.0, entries[0].start));
	ASSERT(near(3.5, entries[0].end));
	ASSERT_EQUALS("Hello world", entries[0].content);
	ASSERT_EQUALS("Second line\non two lines", entries[1].content);
}

unittest("parseSrt: CRLF, missing index and trailing coordinates") {
	auto entries = parseSrt("\r\n00:00:01,000 --> 00:00:02,000 X1:10 X2:20\r\nHi\r\n\r\n");
	ASSERT_EQUALS(1u, entries.size());
	ASSERT(near(2.0, entries[0].end));
	ASSERT_EQUALS("Hi", entries[0].content);
}

unittest("parseSrt: blank lines inside a block") {
	auto entries = parseSrt("1\n00:00:01,000 --> 00:00:02,000\nfirst\n\nsecond\n");
	ASSERT_EQUALS(1u, entries.size());
	ASSERT_EQUALS("first\n\nsecond", entries[0].content);
}

unittest("parseSrt: errors") {
	ASSERT_THROWN(parseSrt("just some text"));
	ASSERT_THROWN(parseSrt("1\n00:00:01 --> later\nHi\n"));
	ASSERT_THROWN(parseSrt("1\n00:00:05,000 --> 00:00:02,000\nBackwards\n"));
	ASSERT_EQUALS(0u, parseSrt("\n\n").size());
}

unittest("isSrt") {
	ASSERT(isSrt(sample));
	ASSERT(!isSrt(""));
	ASSERT(!isSrt("Welcome to the show"));
	ASSERT(!isSrt("12\n"));
}

unittest("composeSrt: renumbered, inner blank lines kept") {
	SrtEntry a, b;
	a.start = 4;
	a.end = 6;
	a.content = "\nfirst\n  \nsecond\n\n";
	b.start = 3661.5;
	b.end = 3662;
	b.content = "third";
	ASSERT_EQUALS(
	    "1\n00:00:04,000 --> 00:00:06,000\nfirst\n\nsecond\n\n"
	    "2\n01:01:01,500 --> 01:01:02,000\nthird\n\n",
	    composeSrt({a, b}));
	ASSERT_EQUALS("", composeSrt({}));
}

unittest("composeSrt: parsed back to the same contents") {
	auto const input = "1\n00:00:01,000 --> 00:00:02,000\nfirst\n\nsecond\n\n"
	    "2\n00:00:03,000 --> 00:00:04,000\nthird\n";
	auto const entries = parseSrt(input);
	auto const again = parseSrt(composeSrt(entries));
	ASSERT_EQUALS(2u, again.size());
	ASSERT_EQUALS("first\n\nsecond", again[0].content);
	ASSERT_EQUALS("third", again[1].content);
	ASSERT_EQUALS(composeSrt(entries), composeSrt(again));
}

}
