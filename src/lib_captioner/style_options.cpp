#include "style_options.hpp"
#include "errors.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace Captioner {

Style parseStyle(std::string const& name, LogSink* log) {
	auto const s = toLower(name);
	if (s == "classic")
		return Style::Classic;
	if (s == "karaoke")
		return Style::Karaoke;
	if (s == "highlight")
		return Style::Highlight;
	if (s == "underline")
		return Style::Underline;
	if (s == "word_by_word")
		return Style::WordByWord;

	log->log(Warning, format("Unknown style '%s', defaulting to 'classic'.", name).c_str());
	return Style::Classic;
}

const char* styleName(Style style) {
	switch (style) {
	case Style::Classic: return "classic";
	case Style::Karaoke: return "karaoke";
	case Style::Highlight: return "highlight";
	case Style::Underline: return "underline";
	case Style::WordByWord: return "word_by_word";
	}
	return "classic";
}

std::string formatNumber(double value) {
	char buffer[64];
	if (value == std::floor(value) && std::fabs(value) < 1e15)
		snprintf(buffer, sizeof buffer, "%lld", (long long)value);
	else
		snprintf(buffer, sizeof buffer, "%.10g", value);
	return buffer;
}

StyleOptions withDefaultFontSize(StyleOptions options, int videoHeight) {
	if (options.fontSize <= 0)
		options.fontSize = (int)(videoHeight * 0.05);
	return options;
}

namespace {

bool parseNumber(std::string const& s, double& value) {
	auto const t = trim(s);
	if (t.empty())
		return false;
	char* end = nullptr;
	value = strtod(t.c_str(), &end);
	return end == t.c_str() + t.size() && std::isfinite(value);
}

bool fitsInt(double value) {
	return value > (double)INT_MIN - 1 && value < (double)INT_MAX + 1;
}

// Reads typed values out of the normalized settings, naming the offending key on type errors.
class SettingsReader {
	public:
		SettingsReader(SmallMap<std::string, json::Value> const& settings) : settings(settings) {
		}

		bool has(const char* key) const {
			auto it = settings.find(key);
			return it != settings.end() && !(*it).value.isNull();
		}

		json::Value const& get(const char* key) const {
			return (*settings.find(key)).value;
		}

		void readString(const char* key, std::string& var) const {
			if (!has(key))
				return;
			auto const& v = get(key);
			if (v.type != json::Value::Type::String)
				throw ValidationError(format("Setting '%s' must be a string.", key));
			var = v.stringValue;
		}

		void readBool(const char* key, bool& var) const {
			if (!has(key))
				return;
			auto const& v = get(key);
			switch (v.type) {
			case json::Value::Type::Boolean:
				var = v.boolValue;
				return;
			case json::Value::Type::Integer:
				var = v.intValue != 0;
				return;
			case json::Value::Type::String: {
				auto const s = toLower(trim(v.stringValue));
				if (s == "true" || s == "1") {
					var = true;
					return;
				}
				if (s == "false" || s == "0" || s.empty()) {
					var = false;
					return;
				}
				break;
			}
			default:
				break;
			}
			throw ValidationError(format("Setting '%s' must be a boolean.", key));
		}

		bool readDouble(const char* key, double& var) const {
			if (!has(key))
				return false;
			auto const& v = get(key);
			if (v.isNumber()) {
				var = v.numberValue();
				return true;
			}
			if (v.type == json::Value::Type::String && parseNumber(v.stringValue, var))
				return true;
			throw ValidationError(format("Setting '%s' must be a number.", key));
		}

		void readInt(const char* key, int& var) const {
			double value = 0;
			if (!readDouble(key, value))
				return;
			if (value != std::floor(value))
				throw ValidationError(format("Setting '%s' must be an integer.", key));
			if (!fitsInt(value))
				throw ValidationError(format("Setting '%s' is out of range.", key));
			var = (int)value;
		}

		// pixel coordinates, truncated to int later on
		bool readCoordinate(const char* key, double& var) const {
			if (!readDouble(key, var))
				return false;
			if (!fitsInt(var))
				throw ValidationError(format("Setting '%s' is out of range.", key));
			return true;
		}

		// numbers which are copied verbatim into the ASS style line
		void readNumberText(const char* key, std::string& var) const {
			if (!has(key))
				return;
			auto const& v = get(key);
			if (v.type == json::Value::Type::String) {
				double unused;
				if (!parseNumber(v.stringValue, unused))
					throw ValidationError(format("Setting '%s' must be a number.", key));
				var = trim(v.stringValue);
			} else if (v.isNumber()) {
				var = formatNumber(v.numberValue());
			} else {
				throw ValidationError(format("Setting '%s' must be a number.", key));
			}
		}

	private:
		SmallMap<std::string, json::Value> const& settings;
};

const char* const knownKeys[] = {
	"font_family", "font_size", "line_color", "word_color", "back_color", "box_color", "outline_color",
	"bold", "italic", "underline", "strikeout", "scale_x", "scale_y", "spacing", "angle",
	"border_style", "outline_width", "shadow_offset", "box", "margin_l", "margin_r", "margin_v",
	"position", "alignment", "x", "y", "all_caps", "max_words_per_line", "style",
};

bool isKnownKey(std::string const& key) {
	for (auto k : knownKeys)
		if (key == k)
			return true;
	return false;
}

}

StyleOptions normalizeStyleOptions(json::Value const& settings, LogSink* log, std::string const& logPrefix) {
	if (settings.type != json::Value::Type::Object)
		throw ValidationError("'settings' should be a dictionary.");

	SmallMap<std::string, json::Value> normalized;
	for (auto& pair : settings.objectValue) {
		auto key = pair.key;
		for (auto& c : key)
			if (c == '-')
				c = '_';
		normalized[key] = pair.value;
	}

	auto deprecated = normalized.find("highlight_color");
	if (deprecated != normalized.end()) {
		log->log(Warning, format("%s'highlight_color' is deprecated; merging into 'word_color'.", logPrefix).c_str());
		auto const value = (*deprecated).value;
		normalized.erase(deprecated);
		normalized["word_color"] = value;
	}

	for (auto& pair : normalized)
		if (!isKnownKey(pair.key))
			log->log(Debug, format("%sIgnoring unknown setting '%s'.", logPrefix, pair.key).c_str());

	StyleOptions opt;
	SettingsReader r(normalized);

	r.readString("font_family", opt.fontFamily);
	if (trim(opt.fontFamily).empty())
		throw ValidationError("Setting 'font_family' can't be empty.");

	if (r.readDouble("font_size", opt.fontSize) && opt.fontSize <= 0)
		throw ValidationError("Setting 'font_size' must be positive.");

	r.readString("line_color", opt.lineColor);
	r.readString("word_color", opt.wordColor);
	r.readString("outline_color", opt.outlineColor);

	// 'back_color' wins over 'box_color' unless it is empty
	std::string backColor, boxColor;
	r.readString("back_color", backColor);
	r.readString("box_color", boxColor);
	if (!backColor.empty())
		opt.backColor = backColor;
	else if (!boxColor.empty())
		opt.backColor = boxColor;

	r.readBool("bold", opt.bold);
	r.readBool("italic", opt.italic);
	r.readBool("underline", opt.underline);
	r.readBool("strikeout", opt.strikeout);
	r.readBool("box", opt.box);
	r.readBool("all_caps", opt.allCaps);

	r.readNumberText("scale_x", opt.scaleX);
	r.readNumberText("scale_y", opt.scaleY);
	r.readNumberText("spacing", opt.spacing);
	r.readNumberText("angle", opt.angle);
	r.readNumberText("outline_width", opt.outlineWidth);
	r.readNumberText("shadow_offset", opt.shadowOffset);
	r.readNumberText("margin_l", opt.marginL);
	r.readNumberText("margin_r", opt.marginR);
	r.readNumberText("margin_v", opt.marginV);

	r.readInt("border_style", opt.borderStyle);
	r.readInt("max_words_per_line", opt.maxWordsPerLine);

	r.readString("position", opt.position);
	r.readString("alignment", opt.alignment);
	opt.hasX = r.readCoordinate("x", opt.x);
	opt.hasY = r.readCoordinate("y", opt.y);

	r.readString("style", opt.style);
	opt.style = toLower(trim(opt.style));

	return opt;
}

ReplaceDict normalizeReplaceRules(json::Value const& replace, LogSink* log, std::string const& logPrefix) {
	if (replace.type != json::Value::Type::Array)
		throw ValidationError("'replace' should be a list of objects with 'find' and 'replace' keys.");

	ReplaceDict r;
	for (auto& item : replace.arrayValue) {
		auto const valid = item.type == json::Value::Type::Object
		    && item.has("find") && item.has("replace")
		    && item["find"].type == json::Value::Type::String
		    && item["replace"].type == json::Value::Type::String
		    && !item["find"].stringValue.empty();
		if (!valid) {
			log->log(Warning, format("%sInvalid replace item %s. Skipping.", logPrefix, json::serialize(item)).c_str());
			continue;
		}
		r[item["find"].stringValue] = item["replace"].stringValue;
	}
	return r;
}

}
