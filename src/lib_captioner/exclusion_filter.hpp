#pragma once

#include "transcription.hpp" // ExcludeRange
#include "lib_utils/json.hpp"
#include <string>
#include <vector>

namespace Captioner {

enum class SubtitleKind {
	Ass,
	Srt,
};

// 'ranges' must be an array of {"start": "<time>", "end": "<time>"} objects (see parseTimeString()).
// Throws ValidationError on a malformed, negative or empty range.
std::vector<ExcludeRange> normalizeExcludeRanges(json::Value const& ranges);

// half-open: touching boundaries don't overlap
bool overlaps(double start, double end, ExcludeRange const& range);
bool overlapsAny(double start, double end, std::vector<ExcludeRange> const& ranges);

// Drops the dialogue lines (ASS) or the blocks (SRT) which overlap one of the ranges.
// Everything else is kept as is.
std::string filterSubtitleLines(std::string const& content, std::vector<ExcludeRange> const& ranges, SubtitleKind kind);

}
