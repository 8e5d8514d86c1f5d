#include "style_handlers.hpp"
#include "color.hpp"
#include "time_codec.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"
#include <algorithm>

namespace Captioner {

std::string DialogueEvent::toString() const {
	return format("Dialogue: %s,%s,%s,Default,,0,0,0,,", layer, start, end) + positionTag + colorOverrides + text;
}

namespace {

struct TimedWord {
	std::string text;
	double start, end;
};

DialogueEvent makeEvent(int layer, double start, double end, StyleContext const& ctx, std::string const& colorOverrides, std::string const& text) {
	DialogueEvent e;
	e.layer = layer;
	e.start = formatAssTime(start);
	e.end = formatAssTime(end);
	e.positionTag = positionTag(ctx.placement);
	e.colorOverrides = colorOverrides;
	e.text = text;
	return e;
}

std::string colorTag(std::string const& rgb) {
	return "{\\c" + rgbToAssColor(rgb) + "}";
}

std::string processWord(std::string const& word, StyleContext const& ctx) {
	return processSubtitleText(word, ctx.replaceDict, ctx.options.allCaps, 0);
}

// processed words of a segment, empty ones dropped
std::vector<TimedWord> processWords(Segment const& segment, StyleContext const& ctx) {
	std::vector<TimedWord> r;
	for (auto& w : segment.words) {
		auto text = processWord(w.word, ctx);
		if (!text.empty())
			r.push_back({text, w.start, w.end});
	}
	return r;
}

template<typename T>
std::vector<std::vector<T>> groupBy(std::vector<T> const& items, int maxPerGroup) {
	std::vector<std::vector<T>> r;
	if (maxPerGroup <= 0) {
		r.push_back(items);
		return r;
	}
	for (size_t i = 0; i < items.size(); i += maxPerGroup) {
		auto const last = std::min(items.size(), i + maxPerGroup);
		r.push_back(std::vector<T>(items.begin() + i, items.begin() + last));
	}
	return r;
}

void logPlacement(StyleContext const& ctx, const char* styleName) {
	ctx.log->log(Info, format("[%s] position=%s, alignment=%s, x=%s, y=%s, an_code=%s",
	        styleName, ctx.options.position, ctx.options.alignment, ctx.placement.x, ctx.placement.y, ctx.placement.anchor).c_str());
}

}

std::vector<DialogueEvent> renderClassic(TranscriptionResult const& transcription, StyleContext const& ctx) {
	logPlacement(ctx, "classic");
	std::vector<DialogueEvent> events;
	for (auto& segment : transcription.segments) {
		auto text = trim(segment.text);
		for (auto& c : text)
			if (c == '\n')
				c = ' ';
		text = processSubtitleText(text, ctx.replaceDict, ctx.options.allCaps, ctx.options.maxWordsPerLine);
		events.push_back(makeEvent(0, segment.start, segment.end, ctx, "", text));
	}
	return events;
}

std::vector<DialogueEvent> renderKaraoke(TranscriptionResult const& transcription, StyleContext const& ctx) {
	logPlacement(ctx, "karaoke");
	auto const color = colorTag(ctx.options.wordColor);
	std::vector<DialogueEvent> events;
	for (auto& segment : transcription.segments) {
		if (segment.words.empty())
			continue;

		std::vector<std::string> lines;
		for (auto& group : groupBy(segment.words, ctx.options.maxWordsPerLine)) {
			std::string line;
			for (auto& w : group) {
				auto const centiseconds = roundHalfEven((w.end - w.start) * 100);
				line += format("{\\k%s}", centiseconds) + processWord(w.word, ctx) + " ";
			}
			lines.push_back(trim(line));
		}

		events.push_back(makeEvent(0, segment.words.front().start, segment.words.back().end, ctx, color, join(lines, AssLineBreak)));
	}
	return events;
}

std::vector<DialogueEvent> renderHighlight(TranscriptionResult const& transcription, StyleContext const& ctx) {
	logPlacement(ctx, "highlight");
	auto const lineColor = colorTag(ctx.options.lineColor);
	auto const wordColor = colorTag(ctx.options.wordColor);
	std::vector<DialogueEvent> events;
	for (auto& segment : transcription.segments) {
		auto const words = processWords(segment, ctx);
		if (words.empty())
			continue;

		for (auto& line : groupBy(words, ctx.options.maxWordsPerLine)) {
			std::vector<std::string> base;
			for (auto& w : line)
				base.push_back(w.text);
			events.push_back(makeEvent(0, line.front().start, line.back().end, ctx, lineColor, join(base, " ")));

			for (size_t current = 0; current < line.size(); ++current) {
				auto parts = base;
				parts[current] = wordColor + parts[current] + lineColor;
				events.push_back(makeEvent(1, line[current].start, line[current].end, ctx, lineColor, join(parts, " ")));
			}
		}
	}
	return events;
}

std::vector<DialogueEvent> renderUnderline(TranscriptionResult const& transcription, StyleContext const& ctx) {
	logPlacement(ctx, "underline");
	auto const lineColor = colorTag(ctx.options.lineColor);
	std::vector<DialogueEvent> events;
	for (auto& segment : transcription.segments) {
		auto const words = processWords(segment, ctx);
		for (auto& line : groupBy(words, ctx.options.maxWordsPerLine)) {
			for (size_t current = 0; current < line.size(); ++current) {
				std::vector<std::string> parts;
				for (size_t i = 0; i < line.size(); ++i)
					parts.push_back(i == current ? "{\\u1}" + line[i].text + "{\\u0}" : line[i].text);
				events.push_back(makeEvent(0, line[current].start, line[current].end, ctx, lineColor, join(parts, " ")));
			}
		}
	}
	return events;
}

std::vector<DialogueEvent> renderWordByWord(TranscriptionResult const& transcription, StyleContext const& ctx) {
	logPlacement(ctx, "word_by_word");
	auto const wordColor = colorTag(ctx.options.wordColor);
	std::vector<DialogueEvent> events;
	for (auto& segment : transcription.segments) {
		for (auto& w : segment.words) {
			auto const text = processWord(w.word, ctx);
			if (text.empty())
				continue;
			events.push_back(makeEvent(0, w.start, w.end, ctx, wordColor, text));
		}
	}
	return events;
}

StyleHandler getStyleHandler(Style style) {
	switch (style) {
	case Style::Karaoke: return &renderKaraoke;
	case Style::Highlight: return &renderHighlight;
	case Style::Underline: return &renderUnderline;
	case Style::WordByWord: return &renderWordByWord;
	default: return &renderClassic;
	}
}

std::string renderDialogues(Style style, TranscriptionResult const& transcription, StyleOptions const& options,
    ReplaceDict const& replaceDict, Resolution const& video, LogSink* log) {
	auto const placement = determineAlignmentCode(options.position, options.alignment,
	        options.explicitX(), options.explicitY(), video);
	StyleContext ctx { options, replaceDict, placement, log };

	auto const events = getStyleHandler(style)(transcription, ctx);
	log->log(Info, format("Handled %s dialogues in %s style.", events.size(), styleName(style)).c_str());

	std::vector<std::string> lines;
	for (auto& e : events)
		lines.push_back(e.toString());
	return join(lines, "\n");
}

}
