#include "tests/tests.hpp"
#include "lib_captioner/caption_source.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_utils/log.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

const char* const srtDoc =
    "1\n"
    "00:00:01,000 --> 00:00:02,500\n"
    "  Hello there  \n"
    "\n"
    "2\n"
    "00:00:03,000 --> 00:00:04,000\n"
    "General Kenobi\n";

unittest("classifyCaptionSource") {
	ASSERT_EQUALS(CaptionSource::None, classifyCaptionSource("").kind);
	ASSERT_EQUALS(CaptionSource::Ass, classifyCaptionSource("\xEF\xBB\xBF[Script Info]\nScriptType: v4.00+\n").kind);
	ASSERT_EQUALS(CaptionSource::Srt, classifyCaptionSource(srtDoc).kind);
	ASSERT_EQUALS(CaptionSource::PlainText, classifyCaptionSource("Just some words").kind);
	ASSERT_EQUALS(CaptionSource::PlainText, classifyCaptionSource("   ").kind);
	ASSERT_EQUALS(CaptionSource::PlainText, classifyCaptionSource("1\nnot a time line\n").kind);
	ASSERT_EQUALS("Just some words", classifyCaptionSource("Just some words").content);
}

unittest("kindName") {
	ASSERT_EQUALS(std::string("none"), kindName(CaptionSource::None));
	ASSERT_EQUALS(std::string("ASS"), kindName(CaptionSource::Ass));
	ASSERT_EQUALS(std::string("SRT"), kindName(CaptionSource::Srt));
	ASSERT_EQUALS(std::string("plain text"), kindName(CaptionSource::PlainText));
}

unittest("srtToTranscription") {
	auto const t = srtToTranscription(srtDoc);
	ASSERT_EQUALS(2u, t.segments.size());
	ASSERT(near(1.0, t.segments[0].start));
	ASSERT(near(2.5, t.segments[0].end));
	ASSERT_EQUALS("Hello there", t.segments[0].text);
	ASSERT(t.segments[0].words.empty());
	ASSERT_EQUALS("General Kenobi", t.segments[1].text);
}

unittest("srtToTranscription: invalid document") {
	ASSERT_THROWN(srtToTranscription("1\n00:00:02,000 --> 00:00:01,000\nBackwards\n"));
}

unittest("plainTextToTranscription: whole media duration") {
	auto const t = plainTextToTranscription("  Welcome!  ", true, 42.5, getNullLog());
	ASSERT_EQUALS(1u, t.segments.size());
	ASSERT(near(0, t.segments[0].start));
	ASSERT(near(42.5, t.segments[0].end));
	ASSERT_EQUALS("Welcome!", t.segments[0].text);
}

unittest("plainTextToTranscription: fallback duration") {
	ASSERT(near(PlainTextFallbackDuration, plainTextToTranscription("Hi", false, 42.5, getNullLog()).segments[0].end));
	ASSERT(near(PlainTextFallbackDuration, plainTextToTranscription("Hi", true, 0, getNullLog()).segments[0].end));
	ASSERT(near(PlainTextFallbackDuration, plainTextToTranscription("Hi", true, -3, getNullLog()).segments[0].end));
}

}
