#include "tests/tests.hpp"
#include "lib_appcommon/options.hpp"
#include <cstdio>
#include <stdexcept>

#define NELEMENTS(a) \
  sizeof(a)/sizeof(*(a))

unittest("CmdLineOptions: no flags") {
	std::string outputDir = "./output";
	CmdLineOptions opt;
	opt.add("o", "output-dir", &outputDir);

	const char* argv[] = {
		"progname", "request.json"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<std::string>({"request.json"}), res);
	ASSERT_EQUALS("./output", outputDir);
}

unittest("CmdLineOptions: short and long names") {
	std::string outputDir, fontsDir;
	int n = -1;
	CmdLineOptions opt;
	opt.add("o", "output-dir", &outputDir);
	opt.add("f", "fonts-dir", &fontsDir);
	opt.add("n", "count", &n);

	const char* argv[] = {
		"progname", "-o", "/tmp/subs", "--fonts-dir", "/usr/share/fonts/custom", "request.json", "--count", "34"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("/tmp/subs", outputDir);
	ASSERT_EQUALS("/usr/share/fonts/custom", fontsDir);
	ASSERT_EQUALS(34, n);
	ASSERT_EQUALS(std::vector<std::string>({"request.json"}), res);
}

unittest("CmdLineOptions: long-only option") {
	std::string csv;
	bool noColor = false;
	CmdLineOptions opt;
	opt.add("", "log-csv", &csv);
	opt.addFlag("", "no-color", &noColor);

	const char* argv[] = {
		"progname", "--log-csv", "log.csv", "--no-color"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("log.csv", csv);
	ASSERT(noColor);

	const char* badArgv[] = {
		"progname", "-"
	};
	ASSERT_EQUALS(std::vector<std::string>({"-"}), opt.parse(NELEMENTS(badArgv), badArgv));
}

unittest("CmdLineOptions: vector and flag") {
	std::vector<std::string> values;
	bool keepGoing = false;
	CmdLineOptions opt;
	opt.add("v", "value", &values);
	opt.addFlag("k", "keepGoing", &keepGoing);

	const char* argv[] = {
		"cmd", "--value", "1", "3", "7", "-k"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<std::string>({"1", "3", "7"}), values);
	ASSERT_EQUALS(true, keepGoing);
}

unittest("CmdLineOptions: unknown option") {
	bool keepGoing = false;
	CmdLineOptions opt;
	opt.add("k", "keepGoing", &keepGoing);

	const char* argv[] = {
		"cmd", "--evil"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: invalid number") {
	int n = 0;
	double d = 0;
	CmdLineOptions opt;
	opt.add("n", "count", &n);
	opt.add("d", "duration", &d);

	const char* argv[] = {
		"cmd", "-n", "12abc"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));

	const char* argv2[] = {
		"cmd", "-d", "2.5"
	};
	opt.parse(NELEMENTS(argv2), argv2);
	ASSERT_EQUALS(2.5, d);
}

unittest("CmdLineOptions: unexpected end of command line") {
	std::string outputDir;
	CmdLineOptions opt;
	opt.add("o", "output-dir", &outputDir);

	const char* argv[] = {
		"progname", "-o"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

struct MySize {
	int width, height;
};

static inline void parseValue(MySize& var, ArgQueue& args) {
	auto s = safePop(args);
	if(sscanf(s.c_str(), "%dx%d", &var.width, &var.height) != 2)
		throw std::runtime_error("invalid size");
}

unittest("CmdLineOptions: custom parsing") {
	MySize mySize {};
	CmdLineOptions opt;
	opt.add("s", "size", &mySize);

	const char* argv[] = {
		"progname", "-s", "1920x1080"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(1920, mySize.width);
	ASSERT_EQUALS(1080, mySize.height);
}
