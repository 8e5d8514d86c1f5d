#include "tests/tests.hpp"
#include "lib_captioner/color.hpp"

using namespace Captioner;

unittest("rgbToAssColor: RGB is reordered to BGR") {
	ASSERT_EQUALS("&H000000FF", rgbToAssColor("#FF0000"));
	ASSERT_EQUALS("&H0000FF00", rgbToAssColor("#00FF00"));
	ASSERT_EQUALS("&H00563412", rgbToAssColor("123456"));
}

unittest("rgbToAssColor: digits are upper-cased") {
	ASSERT_EQUALS("&H00EFCDAB", rgbToAssColor("#abcdef"));
}

unittest("rgbToAssColor: malformed colors give opaque white") {
	ASSERT_EQUALS("&H00FFFFFF", rgbToAssColor("red"));
	ASSERT_EQUALS("&H00FFFFFF", rgbToAssColor(""));
	ASSERT_EQUALS("&H00FFFFFF", rgbToAssColor("#FFF"));
	ASSERT_EQUALS("&H00FFFFFF", rgbToAssColor("#12345G"));
	ASSERT_EQUALS("&H00FFFFFF", rgbToAssColor("#1234567"));
	ASSERT_EQUALS(std::string(AssFallbackColor), rgbToAssColor("#FF00"));
}
