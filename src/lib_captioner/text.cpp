#include "text.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

const char* const AssLineBreak = "\\N";

std::string applyReplacements(std::string text, ReplaceDict const& replaceDict) {
	for (auto& rule : replaceDict) {
		auto const& find = rule.key;
		if (find.empty())
			continue;

		auto const needle = toLower(find);
		auto const haystack = toLower(text);

		std::string r;
		size_t pos = 0;
		while (true) {
			auto const found = haystack.find(needle, pos);
			if (found == std::string::npos)
				break;
			r += text.substr(pos, found - pos);
			r += rule.value;
			pos = found + needle.size();
		}
		r += text.substr(pos);
		text = r;
	}
	return text;
}

std::vector<std::string> splitLines(std::string const& text, int maxWordsPerLine) {
	if (maxWordsPerLine <= 0)
		return { text };

	auto const words = splitWords(text);
	std::vector<std::string> lines;
	for (size_t i = 0; i < words.size(); i += maxWordsPerLine) {
		std::vector<std::string> line;
		for (size_t j = i; j < words.size() && j < i + maxWordsPerLine; ++j)
			line.push_back(words[j]);
		lines.push_back(join(line, " "));
	}
	return lines;
}

std::string processSubtitleText(std::string text, ReplaceDict const& replaceDict, bool allCaps, int maxWordsPerLine) {
	text = applyReplacements(text, replaceDict);
	if (allCaps)
		text = toUpper(text);
	if (maxWordsPerLine > 0)
		text = join(splitLines(text, maxWordsPerLine), AssLineBreak);
	return text;
}

}
