#include "tests/tests.hpp"
#include "lib_captioner/exclusion_filter.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

ExcludeRange range(double start, double end) {
	ExcludeRange r;
	r.start = start;
	r.end = end;
	return r;
}

json::Value ranges(std::string const& array) {
	return json::parse("{ \"r\": " + array + " }")["r"];
}

const char* const ass =
    "[Events]\n"
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n"
    "Dialogue: 0,0:00:00.00,0:00:05.00,Default,,0,0,0,,{\\an5\\pos(192,144)}first, with a comma\n"
    "Dialogue: 0,0:00:05.00,0:00:08.00,Default,,0,0,0,,{\\an5\\pos(192,144)}second\n";

unittest("normalizeExcludeRanges") {
	auto r = normalizeExcludeRanges(ranges(R"([{ "start": "00:00:02.000", "end": "3" }, { "start": "1:00", "end": "1:30.5" }])"));
	ASSERT_EQUALS(2u, r.size());
	ASSERT(near(2, r[0].start));
	ASSERT(near(3, r[0].end));
	ASSERT(near(60, r[1].start));
	ASSERT(near(90.5, r[1].end));

	ASSERT_EQUALS(0u, normalizeExcludeRanges(ranges("[]")).size());
	ASSERT_EQUALS(0u, normalizeExcludeRanges(json::Value()).size());
}

unittest("normalizeExcludeRanges: invalid ranges") {
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": 2, "end": "3" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": "2" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": "-2", "end": "3" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": "3", "end": "3" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": "4", "end": "3" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"([{ "start": "later", "end": "3" }])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"(["0-3"])")));
	ASSERT_THROWN(normalizeExcludeRanges(ranges(R"({ "start": "0", "end": "3" })")));
}

unittest("overlaps: half-open intervals") {
	ASSERT(overlaps(0, 5, range(2, 3)));
	ASSERT(overlaps(2.5, 2.6, range(2, 3)));
	ASSERT(overlaps(0, 5, range(4, 10)));
	ASSERT(!overlaps(0, 5, range(5, 6)));
	ASSERT(!overlaps(6, 7, range(5, 6)));
}

unittest("filterSubtitleLines: ASS dialogue inside a range is dropped") {
	auto out = filterSubtitleLines(ass, { range(2, 3) }, SubtitleKind::Ass);
	ASSERT(out.find("first") == std::string::npos);
	ASSERT(out.find("second") != std::string::npos);
	ASSERT(out.find("[Events]") == 0);
}

unittest("filterSubtitleLines: touching ranges don't exclude") {
	auto out = filterSubtitleLines(ass, { range(8, 9) }, SubtitleKind::Ass);
	ASSERT_EQUALS(std::string(ass), out);

	out = filterSubtitleLines(ass, { range(5, 6) }, SubtitleKind::Ass);
	ASSERT(out.find("first") != std::string::npos);
	ASSERT(out.find("second") == std::string::npos);
}

unittest("filterSubtitleLines: any overlapping range excludes") {
	auto out = filterSubtitleLines(ass, { range(20, 30), range(7, 7.5) }, SubtitleKind::Ass);
	ASSERT(out.find("first") != std::string::npos);
	ASSERT(out.find("second") == std::string::npos);
}

unittest("filterSubtitleLines: no range is a no-op") {
	ASSERT_EQUALS(std::string(ass), filterSubtitleLines(ass, {}, SubtitleKind::Ass));
}

unittest("filterSubtitleLines: unparsable dialogue times are kept") {
	auto const content = "Dialogue: 0,soon,later,Default,,0,0,0,,text";
	ASSERT_EQUALS(std::string(content), filterSubtitleLines(content, { range(0, 100) }, SubtitleKind::Ass));
}

unittest("filterSubtitleLines: SRT blocks are renumbered") {
	auto const srt =
	    "1\n00:00:00,000 --> 00:00:02,000\nfirst\n\n"
	    "2\n00:00:02,000 --> 00:00:04,000\nsecond\n\n"
	    "3\n00:00:04,000 --> 00:00:06,000\nthird\n\n";
	ASSERT_EQUALS(
	    "1\n00:00:00,000 --> 00:00:02,000\nfirst\n\n"
	    "2\n00:00:04,000 --> 00:00:06,000\nthird\n\n",
	    filterSubtitleLines(srt, { range(2.5, 3) }, SubtitleKind::Srt));
}

}
