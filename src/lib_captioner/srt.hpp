#pragma once

#include <string>
#include <vector>

namespace Captioner {

struct SrtEntry {
	double start = 0;
	double end = 0;
	std::string content; // may span several lines
};

// Parses SubRip blocks ("index", "start --> end", content lines).
// Throws FormatError on a malformed timestamp line, on an inverted block or when
// there is text before the first timestamp line.
std::vector<SrtEntry> parseSrt(std::string const& content);

// true when parseSrt() succeeds and finds at least one block
bool isSrt(std::string const& content);

// Renumbers the entries from 1. Leading and trailing blank lines of a content are
// dropped, inner ones are kept so that parseSrt reads the same content back.
std::string composeSrt(std::vector<SrtEntry> const& entries);

}
