#pragma once

#include "lib_captioner/collaborators.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>

namespace Media {

// Parses a whisper JSON transcript: {"language": ..., "segments": [{"start", "end", "text", "words": [{"word", "start", "end"}]}]}
// Throws FormatError.
Captioner::TranscriptionResult parseWhisperTranscript(std::string const& text, std::string const& language, LogSink* log);

// Reads the transcript produced by whisper for a media file: either 'transcriptPath',
// or the "<media>.json" sidecar file when 'transcriptPath' is empty.
class WhisperJsonTranscriber : public Captioner::ITranscriber {
	public:
		WhisperJsonTranscriber(std::string const& transcriptPath, LogSink* log);

		Captioner::TranscriptionResult transcribe(std::string const& mediaPath, std::string const& language) override;

	private:
		std::string const transcriptPath;
		LogSink* const m_log;
};

}
