#include "ass_header.hpp"
#include "color.hpp"
#include "lib_utils/format.hpp"

namespace Captioner {

namespace {
const char* flag(bool value) {
	return value ? "1" : "0";
}
}

StyleHeaderBuilder::StyleHeaderBuilder(FontCatalog& fonts, LogSink* log)
	: fonts(fonts), m_log(log) {
}

std::string StyleHeaderBuilder::styleLine(StyleOptions const& opt) {
	fonts.require(opt.fontFamily);

	auto const lineColor = rgbToAssColor(opt.lineColor);
	auto const borderStyle = opt.box ? 3 : opt.borderStyle; // 3: opaque box filled with BackColour

	std::string r = "Style: Default,";
	r += fonts.resolveAssFamily(opt.fontFamily) + ",";
	r += formatNumber(opt.fontSize) + ",";
	r += lineColor + ",";
	r += lineColor + ",";
	r += rgbToAssColor(opt.outlineColor) + ",";
	r += rgbToAssColor(opt.backColor) + ",";
	r += format("%s,%s,%s,%s,", flag(opt.bold), flag(opt.italic), flag(opt.underline), flag(opt.strikeout));
	r += format("%s,%s,%s,%s,", opt.scaleX, opt.scaleY, opt.spacing, opt.angle);
	r += format("%s,%s,%s,", borderStyle, opt.outlineWidth, opt.shadowOffset);
	r += "5,"; // alignment, overridden by each event
	r += format("%s,%s,%s,0", opt.marginL, opt.marginR, opt.marginV);

	m_log->log(Debug, format("Created ASS style line: %s", r).c_str());
	return r;
}

std::string StyleHeaderBuilder::build(StyleOptions const& options, Resolution const& video) {
	auto const style = styleLine(options);

	std::string r;
	r += "[Script Info]\n";
	r += "ScriptType: v4.00+\n";
	r += format("PlayResX: %s\n", video.width);
	r += format("PlayResY: %s\n", video.height);
	r += "ScaledBorderAndShadow: yes\n";
	r += "\n";
	r += "[V4+ Styles]\n";
	r += "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding\n";
	r += style + "\n";
	r += "\n";
	r += "[Events]\n";
	r += "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n";
	return r;
}

}
