#include "lib_utils/json.hpp"
#include "tests/tests.hpp"
#include <vector>

using namespace std;

namespace {
bool jsonOk(string text) {
	try {
		json::parse(text);
		return true;
	} catch(exception const &) {
		return false;
	}
}
}

unittest("Json parser: empty") {
	ASSERT(jsonOk("{}"));
	ASSERT(!jsonOk("{"));
}

unittest("Json parser: objectValue") {
	ASSERT(jsonOk("{ \"var\": 0 }"));
	ASSERT(jsonOk("{ \"var\": -10 }"));
	ASSERT(jsonOk("{ \"hello\": \"world\" }"));
	ASSERT(jsonOk("{ \"N1\": \"V1\", \"N2\": \"V2\" }"));

	ASSERT(!jsonOk("{ \"N1\" : : \"V2\" }"));
}

unittest("Json parser: booleans") {
	ASSERT(jsonOk("{ \"var\": true }"));
	ASSERT(jsonOk("{ \"var\": false }"));

	{
		auto o = json::parse("{ \"isCool\" : true }");
		auto s = o["isCool"];
		ASSERT_EQUALS((int)json::Value::Type::Boolean, (int)s.type);
		ASSERT_EQUALS(true, s.boolValue);
	}

	{
		auto o = json::parse("{ \"isSlow\" : false }");
		auto s = o["isSlow"];
		ASSERT_EQUALS((int)json::Value::Type::Boolean, (int)s.type);
		ASSERT_EQUALS(false, s.boolValue);
	}
}

unittest("Json parser: non-zero terminated") {
	ASSERT(!jsonOk("{ \"isCool\" : true } _invalid_json_token_"));
}

unittest("Json parser: arrays") {
	ASSERT(jsonOk("{ \"A\": [] }"));
	ASSERT(jsonOk("{ \"A\": [ { }, { } ] }"));
	ASSERT(jsonOk("{ \"A\": [ \"hello\", \"world\" ] }"));

	ASSERT(!jsonOk("{ \"A\": [ }"));
	ASSERT(!jsonOk("{ \"A\": ] }"));
}

unittest("Json parser: returned value") {
	{
		auto o = json::parse("{}");
		ASSERT_EQUALS(0u, o.objectValue.size());
	}
	{
		auto o = json::parse("{ \"N\" : \"hello\"}");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS("hello", s.stringValue);
	}
	{
		auto o = json::parse("{ \"N\" : -1234 }");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS((int)json::Value::Type::Integer, (int)s.type);
		ASSERT_EQUALS(-1234, s.intValue);
	}
}


unittest("Json parser: floats and null") {
	auto o = json::parse("{ \"a\": 1.5, \"b\": -2e3, \"c\": null, \"d\": 7 }");
	ASSERT_EQUALS((int)json::Value::Type::Float, (int)o["a"].type);
	ASSERT_EQUALS(1.5, o["a"].floatValue);
	ASSERT_EQUALS(-2000.0, o["b"].numberValue());
	ASSERT(o["c"].isNull());
	ASSERT_EQUALS(7.0, o["d"].numberValue());
	ASSERT(o["d"].isNumber());

	ASSERT(!jsonOk("{ \"a\": 1. }"));
	ASSERT(!jsonOk("{ \"a\": - }"));
	ASSERT(!jsonOk("{ \"a\": nul }"));
}

unittest("Json parser: integers out of range become floats") {
	auto o = json::parse("{ \"big\": 12345678901 }");
	ASSERT_EQUALS((int)json::Value::Type::Float, (int)o["big"].type);
	ASSERT_EQUALS(12345678901.0, o["big"].numberValue());
}

unittest("Json parser: string escapes") {
	auto o = json::parse(R"({ "s": "a\"b\\c\/d\n\t" })");
	ASSERT_EQUALS("a\"b\\c/d\n\t", o["s"].stringValue);

	auto u = json::parse(R"({ "s": "caf\u00e9 \ud83d\ude00" })");
	ASSERT_EQUALS("caf\xc3\xa9 \xf0\x9f\x98\x80", u["s"].stringValue);

	ASSERT(!jsonOk(R"({ "s": "\x" })"));
	ASSERT(!jsonOk(R"({ "s": "\ud83d" })"));
	ASSERT(!jsonOk("{ \"s\": \"unterminated }"));
}

unittest("Json parser: duplicate keys keep the last value") {
	auto o = json::parse("{ \"k\": 1, \"k\": 2 }");
	ASSERT_EQUALS(1u, o.objectValue.size());
	ASSERT_EQUALS(2, o["k"].intValue);
}

unittest("Json: has and missing members") {
	auto o = json::parse("{ \"k\": 1 }");
	ASSERT(o.has("k"));
	ASSERT(!o.has("z"));
	ASSERT_THROWN(o["z"]);
}

unittest("Json serializer") {
	json::Value v;
	v.type = json::Value::Type::Object;
	v.objectValue["error"] = json::makeString("Font \"X\" not available.\n");
	v.objectValue["available_fonts"] = json::makeArray({ json::makeString("Arial"), json::makeString("DejaVu Sans") });
	ASSERT_EQUALS("{\"error\": \"Font \\\"X\\\" not available.\\n\", \"available_fonts\": [\"Arial\", \"DejaVu Sans\"]}", json::serialize(v));

	auto o = json::parse("{ \"a\": [1, 2.5, true, null] }");
	ASSERT_EQUALS("{\"a\": [1, 2.5, true, null]}", json::serialize(o));
}
