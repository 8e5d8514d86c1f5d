#include "whisper_transcript.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/os.hpp"

using namespace Captioner;

namespace Media {

namespace {

bool getNumber(json::Value const& obj, const char* key, double& value) {
	if (!obj.has(key) || !obj[key].isNumber())
		return false;
	value = obj[key].numberValue();
	return true;
}

std::string getString(json::Value const& obj, const char* key) {
	if (!obj.has(key) || obj[key].type != json::Value::Type::String)
		return "";
	return obj[key].stringValue;
}

}

TranscriptionResult parseWhisperTranscript(std::string const& text, std::string const& language, LogSink* log) {
	json::Value doc;
	try {
		doc = json::parse(text);
	} catch (std::exception const& e) {
		throw FormatError(format("Invalid transcript: %s", e.what()));
	}

	if (!doc.has("segments") || doc["segments"].type != json::Value::Type::Array)
		throw FormatError("Invalid transcript: 'segments' should be a list.");

	auto const detected = getString(doc, "language");
	if (language != "auto" && !detected.empty() && detected != language)
		log->log(Warning, format("Transcript language is '%s', '%s' was requested.", detected, language).c_str());

	TranscriptionResult r;
	int index = 0;
	for (auto& item : doc["segments"].arrayValue) {
		++index;
		Segment segment;
		if (item.type != json::Value::Type::Object || !getNumber(item, "start", segment.start) || !getNumber(item, "end", segment.end))
			throw FormatError(format("Invalid transcript: segment %s has no timings.", index));

		if (segment.end <= segment.start) {
			log->log(Warning, format("Skipping transcript segment %s: it ends before it starts.", index).c_str());
			continue;
		}

		segment.text = getString(item, "text");

		if (item.has("words") && item["words"].type == json::Value::Type::Array) {
			for (auto& w : item["words"].arrayValue) {
				if (w.type != json::Value::Type::Object)
					continue;
				WordTiming word;
				word.word = getString(w, "word");
				if (!getNumber(w, "start", word.start) || !getNumber(w, "end", word.end))
					continue;
				segment.words.push_back(word);
			}
		}

		r.segments.push_back(segment);
	}

	log->log(Info, format("Transcript: %s segments", r.segments.size()).c_str());
	return r;
}

WhisperJsonTranscriber::WhisperJsonTranscriber(std::string const& transcriptPath, LogSink* log)
	: transcriptPath(transcriptPath), m_log(log) {
}

TranscriptionResult WhisperJsonTranscriber::transcribe(std::string const& mediaPath, std::string const& language) {
	auto const path = transcriptPath.empty() ? mediaPath + ".json" : transcriptPath;
	if (!fileExists(path))
		throw SourceRetrievalError(format("No transcript found for '%s' (expected '%s').", mediaPath, path));

	m_log->log(Info, format("Reading transcript '%s'", path).c_str());
	return parseWhisperTranscript(readFile(path), language, m_log);
}

}
