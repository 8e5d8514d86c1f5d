#include "tests/tests.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_captioner/time_codec.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

unittest("formatAssTime: zero") {
	ASSERT_EQUALS("0:00:00.00", formatAssTime(0));
}

unittest("formatAssTime: hours, minutes and centiseconds") {
	ASSERT_EQUALS("1:01:01.50", formatAssTime(3661.5));
	ASSERT_EQUALS("0:00:05.25", formatAssTime(5.25));
	ASSERT_EQUALS("0:01:00.00", formatAssTime(60));
}

unittest("formatAssTime: hours are not limited to two digits") {
	ASSERT_EQUALS("100:00:00.00", formatAssTime(360000));
}

unittest("formatAssTime: centiseconds rounding carries over") {
	ASSERT_EQUALS("0:00:02.00", formatAssTime(1.999));
	ASSERT_EQUALS("0:01:00.00", formatAssTime(59.996));
	ASSERT_EQUALS("1:00:00.00", formatAssTime(3599.999));
}

unittest("formatAssTime: negative times are clamped") {
	ASSERT_EQUALS("0:00:00.00", formatAssTime(-3.2));
}

unittest("parseAssTime: inverse of formatAssTime") {
	ASSERT(near(3661.5, parseAssTime("1:01:01.50")));
	ASSERT(near(5.0, parseAssTime("0:00:05.00")));
	ASSERT(near(1234.56, parseAssTime(formatAssTime(1234.56))));
	ASSERT_THROWN(parseAssTime("0:00:05"));
	ASSERT_THROWN(parseAssTime("garbage"));

	double t = -1;
	ASSERT(!tryParseAssTime("0:00:05.00x", t));
	ASSERT(tryParseAssTime(" 0:00:05.00", t));
	ASSERT(near(5.0, t));
}

unittest("parseTimeString: colon forms") {
	ASSERT(near(3723.45, parseTimeString("01:02:03.450")));
	ASSERT(near(3723.0, parseTimeString("1:02:03")));
	ASSERT(near(62.5, parseTimeString("01:02.5")));
	ASSERT(near(62.0, parseTimeString("1:02")));
}

unittest("parseTimeString: bare seconds") {
	ASSERT(near(5.5, parseTimeString("5.5")));
	ASSERT(near(90.0, parseTimeString("90")));
	ASSERT(near(-2.0, parseTimeString("-2")));
}

unittest("parseTimeString: invalid strings") {
	ASSERT_THROWN(parseTimeString(""));
	ASSERT_THROWN(parseTimeString("abc"));
	ASSERT_THROWN(parseTimeString("1:2:3:4"));
	ASSERT_THROWN(parseTimeString("01:02.1234"));
	ASSERT_THROWN(parseTimeString("inf"));

	try {
		parseTimeString("soon");
		ASSERT(0);
	} catch (ValidationError const& e) {
		ASSERT_EQUALS("Invalid time string: soon", std::string(e.what()));
	}
}

unittest("SRT times") {
	ASSERT_EQUALS("00:00:00,000", formatSrtTime(0));
	ASSERT_EQUALS("01:01:01,500", formatSrtTime(3661.5));

	double t = 0;
	ASSERT(tryParseSrtTime("00:01:02,345", t));
	ASSERT(near(62.345, t));
	ASSERT(tryParseSrtTime(" 00:01:02.345 ", t));
	ASSERT(near(62.345, t));
	ASSERT(!tryParseSrtTime("00:01", t));
	ASSERT(near(62.345, parseSrtTime("00:01:02,345")));
	ASSERT_THROWN(parseSrtTime("1.5"));
}

unittest("roundHalfEven") {
	ASSERT_EQUALS(2LL, roundHalfEven(2.5));
	ASSERT_EQUALS(4LL, roundHalfEven(3.5));
	ASSERT_EQUALS(3LL, roundHalfEven(2.6));
	ASSERT_EQUALS(25LL, roundHalfEven(25.0));
	ASSERT_EQUALS(-2LL, roundHalfEven(-2.5));
}

}
