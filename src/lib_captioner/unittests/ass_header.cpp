#include "tests/tests.hpp"
#include "lib_captioner/ass_header.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_utils/log.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

unittest("StyleHeaderBuilder: default style") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	StyleHeaderBuilder builder(fonts, getNullLog());

	Resolution video;
	video.width = 1920;
	video.height = 1080;
	auto const header = builder.build(withDefaultFontSize(StyleOptions(), video.height), video);

	ASSERT_EQUALS(
	    "[Script Info]\n"
	    "ScriptType: v4.00+\n"
	    "PlayResX: 1920\n"
	    "PlayResY: 1080\n"
	    "ScaledBorderAndShadow: yes\n"
	    "\n"
	    "[V4+ Styles]\n"
	    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding\n"
	    "Style: Default,Arial,54,&H00FFFFFF,&H00FFFFFF,&H00000000,&H00000000,0,0,0,0,100,100,0,0,1,2,0,5,20,20,20,0\n"
	    "\n"
	    "[Events]\n"
	    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n",
	    header);
}

unittest("StyleHeaderBuilder: style line fields") {
	StubFontSource source;
	source.custom = { { "Montserrat-Bold", "Montserrat, Montserrat Bold" } };
	FontCatalog fonts(&source, getNullLog());
	StyleHeaderBuilder builder(fonts, getNullLog());

	StyleOptions opt;
	opt.fontFamily = "montserrat-bold";
	opt.fontSize = 36.5;
	opt.lineColor = "#FF0000";
	opt.outlineColor = "#00FF00";
	opt.backColor = "#0000FF";
	opt.bold = true;
	opt.strikeout = true;
	opt.scaleX = "120";
	opt.angle = "12.5";
	opt.borderStyle = 1;
	opt.box = true;
	opt.marginV = "40";

	ASSERT_EQUALS("Style: Default,Montserrat,36.5,&H000000FF,&H000000FF,&H0000FF00,&H00FF0000,1,0,0,1,120,100,0,12.5,3,2,0,5,20,20,40,0",
	    builder.styleLine(opt));
}

unittest("StyleHeaderBuilder: unknown font") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	StyleHeaderBuilder builder(fonts, getNullLog());

	StyleOptions opt;
	opt.fontFamily = "Papyrus";
	opt.fontSize = 20;
	try {
		builder.build(opt, Resolution());
		ASSERT(0);
	} catch (FontUnavailableError const& e) {
		ASSERT_EQUALS("Papyrus", e.requested);
		ASSERT_EQUALS(6u, e.availableFonts.size());
	}
}

}
