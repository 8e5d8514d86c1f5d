#include "exclusion_filter.hpp"
#include "errors.hpp"
#include "srt.hpp"
#include "time_codec.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

std::vector<ExcludeRange> normalizeExcludeRanges(json::Value const& ranges) {
	if (ranges.isNull())
		return {};
	if (ranges.type != json::Value::Type::Array)
		throw ValidationError("'exclude_time_ranges' should be a list of objects with 'start' and 'end' keys.");

	std::vector<ExcludeRange> r;
	for (auto& item : ranges.arrayValue) {
		auto const isString = [&](const char* key) {
			return item.has(key) && item[key].type == json::Value::Type::String;
		};
		if (item.type != json::Value::Type::Object || !isString("start") || !isString("end"))
			throw ValidationError("exclude_time_ranges start/end must be strings in hh:mm:ss.ms format.");

		ExcludeRange range;
		range.start = parseTimeString(item["start"].stringValue);
		range.end = parseTimeString(item["end"].stringValue);
		if (range.start < 0 || range.end < 0)
			throw ValidationError("exclude_time_ranges start/end must be non-negative.");
		if (range.end <= range.start)
			throw ValidationError("exclude_time_ranges end must be strictly greater than start.");
		r.push_back(range);
	}
	return r;
}

bool overlaps(double start, double end, ExcludeRange const& range) {
	return start < range.end && end > range.start;
}

bool overlapsAny(double start, double end, std::vector<ExcludeRange> const& ranges) {
	for (auto& range : ranges)
		if (overlaps(start, end, range))
			return true;
	return false;
}

namespace {

bool isExcludedDialogue(std::string line, std::vector<ExcludeRange> const& ranges) {
	if (!line.empty() && line.back() == '\r')
		line.pop_back();
	if (!startsWith(line, "Dialogue:"))
		return false;

	auto const fields = split(line, ',');
	if (fields.size() < 4)
		return false;

	double start, end;
	if (!tryParseAssTime(fields[1], start) || !tryParseAssTime(fields[2], end))
		return false;

	return overlapsAny(start, end, ranges);
}

std::string filterAss(std::string const& content, std::vector<ExcludeRange> const& ranges) {
	std::vector<std::string> kept;
	for (auto& line : split(content, '\n'))
		if (!isExcludedDialogue(line, ranges))
			kept.push_back(line);
	return join(kept, "\n");
}

std::string filterSrt(std::string const& content, std::vector<ExcludeRange> const& ranges) {
	std::vector<SrtEntry> kept;
	for (auto& entry : parseSrt(content))
		if (!overlapsAny(entry.start, entry.end, ranges))
			kept.push_back(entry);
	return composeSrt(kept);
}

}

std::string filterSubtitleLines(std::string const& content, std::vector<ExcludeRange> const& ranges, SubtitleKind kind) {
	if (ranges.empty())
		return content;

	switch (kind) {
	case SubtitleKind::Ass: return filterAss(content, ranges);
	case SubtitleKind::Srt: return filterSrt(content, ranges);
	}
	return content;
}

}
