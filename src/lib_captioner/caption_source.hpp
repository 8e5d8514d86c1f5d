#pragma once

#include "transcription.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>

namespace Captioner {

// What the user supplied as 'captions', classified once per request.
struct CaptionSource {
	enum Kind {
		None, // nothing supplied: the media must be transcribed
		Ass, // complete ASS document, used as is
		Srt,
		PlainText, // shown for the whole duration of the media
	};

	Kind kind = None;
	std::string content;
};

const char* kindName(CaptionSource::Kind kind);

// "[Script Info]" anywhere means ASS, then SRT if it parses, then plain text.
// Empty content means None.
CaptionSource classifyCaptionSource(std::string const& content);

// One segment per SRT block, without word timings. Throws FormatError.
TranscriptionResult srtToTranscription(std::string const& content);

// A single segment covering [0, duration]. Falls back to 10s when the duration is unknown or not positive.
TranscriptionResult plainTextToTranscription(std::string const& text, bool hasDuration, double duration, LogSink* log);

static const double PlainTextFallbackDuration = 10.0;

}
