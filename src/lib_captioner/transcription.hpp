#pragma once

#include <string>
#include <vector>

namespace Captioner {

struct WordTiming {
	std::string word;
	double start = 0;
	double end = 0;
};

// invariant: end > start
struct Segment {
	double start = 0;
	double end = 0;
	std::string text;
	std::vector<WordTiming> words; // empty when the source has no word-level timings (SRT, plain text)
};

struct TranscriptionResult {
	std::vector<Segment> segments;
};

// invariant: 0 <= start < end
struct ExcludeRange {
	double start = 0;
	double end = 0;
};

struct Resolution {
	int width = 384;
	int height = 288;
};

}
