#include "tests/tests.hpp"
#include "lib_captioner/alignment.hpp"

using namespace Captioner;

namespace {

Resolution fullHd() {
	Resolution r;
	r.width = 1920;
	r.height = 1080;
	return r;
}

unittest("determineAlignmentCode: explicit x and y ignore the position") {
	double x = 100, y = 50;
	auto p = determineAlignmentCode("top_right", "left", &x, &y, fullHd());
	ASSERT_EQUALS(4, p.anchor);
	ASSERT_EQUALS(100, p.x);
	ASSERT_EQUALS(50, p.y);

	p = determineAlignmentCode("bottom_left", "right", &x, &y, fullHd());
	ASSERT_EQUALS(6, p.anchor);

	p = determineAlignmentCode("bottom_left", "unknown", &x, &y, fullHd());
	ASSERT_EQUALS(5, p.anchor);
}

unittest("determineAlignmentCode: explicit coordinates are truncated") {
	double x = 100.9, y = 49.5;
	auto p = determineAlignmentCode("", "center", &x, &y, fullHd());
	ASSERT_EQUALS(100, p.x);
	ASSERT_EQUALS(49, p.y);
}

unittest("determineAlignmentCode: x alone is ignored") {
	double x = 100;
	auto p = determineAlignmentCode("middle_center", "center", &x, nullptr, fullHd());
	ASSERT_EQUALS(5, p.anchor);
	ASSERT_EQUALS(960, p.x);
	ASSERT_EQUALS(540, p.y);
}

unittest("determineAlignmentCode: top right cell, left aligned") {
	auto p = determineAlignmentCode("top_right", "left", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(7, p.anchor);
	ASSERT_EQUALS(1280, p.x);
	ASSERT_EQUALS(180, p.y);
}

unittest("determineAlignmentCode: grid cells") {
	auto p = determineAlignmentCode("bottom_left", "center", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(2, p.anchor);
	ASSERT_EQUALS(320, p.x);
	ASSERT_EQUALS(900, p.y);

	p = determineAlignmentCode("middle_right", "right", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(6, p.anchor);
	ASSERT_EQUALS(1920, p.x);
	ASSERT_EQUALS(540, p.y);

	p = determineAlignmentCode("top_center", "left", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(7, p.anchor);
	ASSERT_EQUALS(640, p.x);
}

unittest("determineAlignmentCode: keywords are case-insensitive substrings") {
	auto p = determineAlignmentCode("TOP-LEFT", "Right", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(9, p.anchor);
	ASSERT_EQUALS(640, p.x);

	// neither top nor middle: bottom row
	p = determineAlignmentCode("somewhere", "center", nullptr, nullptr, fullHd());
	ASSERT_EQUALS(2, p.anchor);
	ASSERT_EQUALS(960, p.x);
	ASSERT_EQUALS(900, p.y);
}

unittest("determineAlignmentCode: default resolution") {
	auto p = determineAlignmentCode("middle_center", "center", nullptr, nullptr, Resolution());
	ASSERT_EQUALS(5, p.anchor);
	ASSERT_EQUALS(192, p.x);
	ASSERT_EQUALS(144, p.y);
}

unittest("positionTag") {
	Placement p;
	p.anchor = 7;
	p.x = 1280;
	p.y = 180;
	ASSERT_EQUALS("{\\an7\\pos(1280,180)}", positionTag(p));
}

}
