#pragma once

#include "alignment.hpp"
#include "style_options.hpp"
#include "text.hpp"
#include "transcription.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>
#include <vector>

namespace Captioner {

struct DialogueEvent {
	int layer = 0;
	std::string start, end; // ASS time
	std::string positionTag;
	std::string colorOverrides;
	std::string text;

	// "Dialogue: <layer>,<start>,<end>,Default,,0,0,0,,<positionTag><colorOverrides><text>"
	std::string toString() const;
};

// Everything a style handler needs, resolved once per request.
struct StyleContext {
	StyleOptions const& options;
	ReplaceDict const& replaceDict;
	Placement placement;
	LogSink* log;
};

typedef std::vector<DialogueEvent> (*StyleHandler)(TranscriptionResult const& transcription, StyleContext const& ctx);

std::vector<DialogueEvent> renderClassic(TranscriptionResult const& transcription, StyleContext const& ctx);
std::vector<DialogueEvent> renderKaraoke(TranscriptionResult const& transcription, StyleContext const& ctx);
std::vector<DialogueEvent> renderHighlight(TranscriptionResult const& transcription, StyleContext const& ctx);
std::vector<DialogueEvent> renderUnderline(TranscriptionResult const& transcription, StyleContext const& ctx);
std::vector<DialogueEvent> renderWordByWord(TranscriptionResult const& transcription, StyleContext const& ctx);

StyleHandler getStyleHandler(Style style);

// Resolves the placement, runs the handler of 'style' and serializes the events, one per line.
std::string renderDialogues(Style style, TranscriptionResult const& transcription, StyleOptions const& options,
    ReplaceDict const& replaceDict, Resolution const& video, LogSink* log);

}
