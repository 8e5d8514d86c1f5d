#include "tests/tests.hpp"
#include "lib_media/transcribe/whisper_transcript.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"
#include <cmath>

using namespace Media;
using namespace Captioner;

namespace {

const char* const transcript = R"({
	"language": "en",
	"text": " Hello world. Bye.",
	"segments": [
		{ "id": 0, "start": 0.0, "end": 1.2, "text": " Hello world.",
			"words": [
				{ "word": " Hello", "start": 0.0, "end": 0.5, "probability": 0.9 },
				{ "word": " world.", "start": 0.5, "end": 1.2 },
				{ "word": " uh" }
			] },
		{ "id": 1, "start": 3, "end": 3, "text": " empty" },
		{ "id": 2, "start": 4, "end": 5, "text": " Bye." }
	]
})";

bool near(double a, double b) {
	return std::fabs(a - b) < 1e-6;
}

unittest("whisper transcript: segments and words") {
	auto const t = parseWhisperTranscript(transcript, "auto", getNullLog());
	ASSERT_EQUALS(2u, t.segments.size());

	auto const& first = t.segments[0];
	ASSERT(near(0, first.start));
	ASSERT(near(1.2, first.end));
	ASSERT_EQUALS(" Hello world.", first.text);
	ASSERT_EQUALS(2u, first.words.size());
	ASSERT_EQUALS(" world.", first.words[1].word);
	ASSERT(near(0.5, first.words[1].start));

	ASSERT_EQUALS(" Bye.", t.segments[1].text);
	ASSERT(t.segments[1].words.empty());
}

unittest("whisper transcript: language mismatch is not an error") {
	ASSERT_EQUALS(2u, parseWhisperTranscript(transcript, "fr", getNullLog()).segments.size());
}

unittest("whisper transcript: invalid documents") {
	ASSERT_THROWN(parseWhisperTranscript("not json", "auto", getNullLog()));
	ASSERT_THROWN(parseWhisperTranscript(R"({ "text": "no segments" })", "auto", getNullLog()));
	ASSERT_THROWN(parseWhisperTranscript(R"({ "segments": [ { "text": "no timings" } ] })", "auto", getNullLog()));
}

unittest("whisper transcript: error type") {
	try {
		parseWhisperTranscript(R"({ "segments": {} })", "auto", getNullLog());
		ASSERT(0);
	} catch (FormatError const& e) {
		ASSERT_EQUALS("Invalid transcript: 'segments' should be a list.", std::string(e.what()));
	}
}

unittest("WhisperJsonTranscriber: sidecar file") {
	auto const media = format("/tmp/captioner_whisper_%s.mp4", getPid());
	writeFile(media + ".json", transcript);

	WhisperJsonTranscriber transcriber("", getNullLog());
	auto const t = transcriber.transcribe(media, "en");
	removeFile(media + ".json");
	ASSERT_EQUALS(2u, t.segments.size());
}

unittest("WhisperJsonTranscriber: missing transcript") {
	WhisperJsonTranscriber transcriber("/nonexistent/transcript.json", getNullLog());
	try {
		transcriber.transcribe("/tmp/video.mp4", "auto");
		ASSERT(0);
	} catch (SourceRetrievalError const& e) {
		ASSERT_EQUALS("No transcript found for '/tmp/video.mp4' (expected '/nonexistent/transcript.json').", std::string(e.what()));
	}
}

}
