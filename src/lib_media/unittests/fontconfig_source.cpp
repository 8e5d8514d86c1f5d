#include "tests/tests.hpp"
#include "lib_media/fonts/fontconfig_source.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"

using namespace Media;

namespace {

unittest("FontconfigSource: missing custom fonts directory") {
	FontconfigSource source("/nonexistent/fonts", getNullLog());
	ASSERT(source.customFonts().empty());
}

unittest("FontconfigSource: custom font files") {
	auto const dir = format("/tmp/captioner_fonts_%s", getPid());
	mkdirIfMissing(dir);
	writeFile(dir + "/Broken.ttf", "not a font");
	writeFile(dir + "/ARIALBD.TTF", "not a font either");
	writeFile(dir + "/readme.txt", "");

	FontconfigSource source(dir, getNullLog());
	auto fonts = source.customFonts();

	for (auto& entry : listDir(dir))
		removeFile(dir + "/" + entry);
	removeDir(dir);

	ASSERT_EQUALS(2u, fonts.size());
	for (auto& font : fonts) {
		ASSERT(font.name == "Broken" || font.name == "ARIALBD");
		ASSERT_EQUALS("", font.family);
	}
}

// depends on the fonts installed on the machine
secondclasstest("FontconfigSource: system families") {
	FontconfigSource source("", getNullLog());
	ASSERT(!source.systemFamilies().empty());
}

}
