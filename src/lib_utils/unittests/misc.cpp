#include "tests/tests.hpp"
#include "lib_utils/tools.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/os.hpp"
#include "lib_utils/small_map.hpp"
#include <algorithm>

using namespace Tests;

namespace {

unittest("format: one argument") {
	ASSERT_EQUALS("45", format("%s", 45));
}

unittest("format: one char argument") {
	ASSERT_EQUALS("A", format("%s", 'A'));
}

unittest("format: string argument") {
	std::string s = "Hello";
	ASSERT_EQUALS("Hello World", format("%s World", s));
}

unittest("format: multiple arguments") {
	ASSERT_EQUALS("1920x1080, 25%", format("%sx%s, %s%%", 1920, 1080, 25));
}

unittest("format: vector") {
	ASSERT_EQUALS("[1, 2]", format("%s", std::vector<int>({1, 2})));
}

unittest("tools: trim") {
	ASSERT_EQUALS("", trim(""));
	ASSERT_EQUALS("", trim(" \t\r\n "));
	ASSERT_EQUALS("a b", trim("  a b\n"));
}

unittest("tools: case conversion is ASCII only") {
	ASSERT_EQUALS("hello world", toLower("HeLLo World"));
	ASSERT_EQUALS("HELLO \xc3\xa9", toUpper("hello \xc3\xa9"));
}

unittest("tools: splitWords") {
	ASSERT_EQUALS(std::vector<std::string>(), splitWords("  "));
	ASSERT_EQUALS(std::vector<std::string>({"a", "b", "c"}), splitWords(" a \tb\nc "));
}

unittest("tools: split and join") {
	ASSERT_EQUALS(std::vector<std::string>({"a", "", "b", ""}), split("a,,b,", ','));
	ASSERT_EQUALS(std::vector<std::string>({""}), split("", ','));
	ASSERT_EQUALS("a,,b,", join(split("a,,b,", ','), ","));
	ASSERT_EQUALS("", join({}, "\n"));
}

unittest("tools: startsWith and endsWith") {
	ASSERT(startsWith("Dialogue: 0", "Dialogue:"));
	ASSERT(!startsWith("Dia", "Dialogue:"));
	ASSERT(endsWith("font.ttf", ".ttf"));
	ASSERT(!endsWith("ttf", ".ttf"));
}

unittest("SmallMap: insertion order, update and erase") {
	SmallMap<std::string, int> m;
	m["b"] = 1;
	m["a"] = 2;
	m["b"] = 3;
	ASSERT_EQUALS(2u, m.size());
	ASSERT_EQUALS("b", m.pairs[0].key);
	ASSERT_EQUALS(3, m.pairs[0].value);
	ASSERT(m.has("a"));
	ASSERT(!m.has("c"));

	m.erase(m.find("b"));
	ASSERT_EQUALS(1u, m.size());
	ASSERT_EQUALS("a", m.begin()->key);

	auto const& constMap = m;
	ASSERT(constMap.find("b") == constMap.end());
}

unittest("log: parse levels") {
	ASSERT_EQUALS((int)Quiet, (int)parseLogLevel("quiet"));
	ASSERT_EQUALS((int)Debug, (int)parseLogLevel("debug"));
	ASSERT_THROWN(parseLogLevel("verbose"));
}

unittest("os: files and directories") {
	auto const dir = format("/tmp/captioner_os_%s", getPid());
	mkdirIfMissing(dir);
	ASSERT(dirExists(dir));

	writeFile(dir + "/a.txt", "hello\n");
	ASSERT(fileExists(dir + "/a.txt"));
	ASSERT(!fileExists(dir));
	ASSERT_EQUALS("hello\n", readFile(dir + "/a.txt"));

	moveFile(dir + "/a.txt", dir + "/b.txt");
	ASSERT_EQUALS(std::vector<std::string>({"b.txt"}), listDir(dir));

	removeFile(dir + "/b.txt");
	removeDir(dir);
	ASSERT(!dirExists(dir));
	ASSERT_THROWN(readFile(dir + "/b.txt"));
}

}
