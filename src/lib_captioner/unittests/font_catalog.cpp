#include "tests/tests.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_captioner/font_catalog.hpp"
#include "lib_utils/log.hpp"
#include "stubs.hpp"
#include <algorithm>

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

bool hasName(std::vector<std::string> const& names, std::string const& name) {
	return std::find(names.begin(), names.end(), name) != names.end();
}

unittest("FontCatalog: system families and custom fonts") {
	StubFontSource source;
	source.custom = { { "Montserrat-Bold", "Montserrat, Montserrat Bold" }, { "Broken", "" } };
	FontCatalog fonts(&source, getNullLog());

	auto names = fonts.availableFontNames();
	ASSERT(hasName(names, "DejaVu Sans"));
	ASSERT(hasName(names, "Montserrat-Bold"));
	ASSERT(hasName(names, "Broken"));
	ASSERT(std::is_sorted(names.begin(), names.end()));
}

unittest("FontCatalog: Arial aliases") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	ASSERT(fonts.contains("ARIALBD"));
	ASSERT(fonts.contains("ariali"));
	ASSERT(fonts.contains("ARIALBI"));

	StubFontSource noArial;
	noArial.system = { "DejaVu Sans" };
	FontCatalog otherFonts(&noArial, getNullLog());
	ASSERT(!otherFonts.contains("ARIALBD"));
}

unittest("FontCatalog: case-insensitive lookup") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	ASSERT(fonts.contains("arial"));
	ASSERT(fonts.contains("DEJAVU SANS"));
	ASSERT(!fonts.contains("Comic Sans MS"));
}

unittest("FontCatalog: require reports the available fonts") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	fonts.require("Liberation Serif");
	try {
		fonts.require("Comic Sans MS");
		ASSERT(0);
	} catch (FontUnavailableError const& e) {
		ASSERT_EQUALS("Font 'Comic Sans MS' not available.", std::string(e.what()));
		ASSERT_EQUALS("Comic Sans MS", e.requested);
		ASSERT(hasName(e.availableFonts, "Arial"));
		ASSERT(hasName(e.availableFonts, "ARIALBD"));
	}
}

unittest("FontCatalog: ASS family resolution") {
	StubFontSource source;
	source.custom = {
		{ "Montserrat-Bold", "Montserrat, Montserrat Bold" },
		{ "NoFamily", "" },
		{ "arialbd", "Arial" },
	};
	FontCatalog fonts(&source, getNullLog());
	ASSERT_EQUALS("Montserrat", fonts.resolveAssFamily("montserrat-bold"));
	ASSERT_EQUALS("NoFamily", fonts.resolveAssFamily("NoFamily"));
	ASSERT_EQUALS("arialbd", fonts.resolveAssFamily("arialbd"));
	ASSERT_EQUALS("DejaVu Sans", fonts.resolveAssFamily("DejaVu Sans"));
	ASSERT_EQUALS("Noto Sans", fonts.resolveAssFamily("Noto Sans, Noto Sans Regular"));
}

unittest("FontCatalog: cached until invalidated") {
	StubFontSource source;
	FontCatalog fonts(&source, getNullLog());
	ASSERT(!fonts.contains("Roboto"));
	source.system.push_back("Roboto");
	ASSERT(!fonts.contains("Roboto"));
	ASSERT_EQUALS(1, source.scans);

	fonts.invalidate();
	ASSERT(fonts.contains("Roboto"));
	ASSERT_EQUALS(2, source.scans);
}

}
