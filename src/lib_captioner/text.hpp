#pragma once

#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

namespace Captioner {

// find -> replace, applied in insertion order
typedef SmallMap<std::string, std::string> ReplaceDict;

// ASS hard line break
extern const char* const AssLineBreak;

// Case-insensitive (ASCII) substring substitution of every rule, in order.
std::string applyReplacements(std::string text, ReplaceDict const& replaceDict);

// Groups of 'maxWordsPerLine' whitespace-separated words.
// When 'maxWordsPerLine' <= 0, returns the text untouched as a single line.
std::vector<std::string> splitLines(std::string const& text, int maxWordsPerLine);

// replacements, then upper case, then line splitting (lines joined with AssLineBreak)
std::string processSubtitleText(std::string text, ReplaceDict const& replaceDict, bool allCaps, int maxWordsPerLine);

}
