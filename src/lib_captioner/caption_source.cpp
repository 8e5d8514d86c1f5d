#include "caption_source.hpp"
#include "srt.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

const char* kindName(CaptionSource::Kind kind) {
	switch (kind) {
	case CaptionSource::None: return "none";
	case CaptionSource::Ass: return "ASS";
	case CaptionSource::Srt: return "SRT";
	case CaptionSource::PlainText: return "plain text";
	}
	return "unknown";
}

CaptionSource classifyCaptionSource(std::string const& content) {
	CaptionSource r;
	r.content = content;
	if (content.empty())
		r.kind = CaptionSource::None;
	else if (content.find("[Script Info]") != std::string::npos)
		r.kind = CaptionSource::Ass;
	else if (isSrt(content))
		r.kind = CaptionSource::Srt;
	else
		r.kind = CaptionSource::PlainText;
	return r;
}

TranscriptionResult srtToTranscription(std::string const& content) {
	TranscriptionResult r;
	for (auto& entry : parseSrt(content)) {
		Segment s;
		s.start = entry.start;
		s.end = entry.end;
		s.text = trim(entry.content);
		r.segments.push_back(s);
	}
	return r;
}

TranscriptionResult plainTextToTranscription(std::string const& text, bool hasDuration, double duration, LogSink* log) {
	if (!hasDuration || !(duration > 0)) {
		duration = PlainTextFallbackDuration;
		log->log(Warning, format("Video duration not available, using %s seconds as fallback.", duration).c_str());
	}

	Segment s;
	s.start = 0;
	s.end = duration;
	s.text = trim(text);

	TranscriptionResult r;
	r.segments.push_back(s);
	return r;
}

}
