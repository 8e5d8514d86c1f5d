#include <iostream>
#include <stdexcept>
#include <cstdlib>
#include <csignal>
#include <climits>
#include <algorithm> // sort
#include "tests.hpp"

namespace {
using TestFunction = void (*)();

struct UnitTest {
	void (*fn)();
	std::string name;

	// To be "FIRST" class, a test must be:
	//
	// * Fast: the total time of the unit tests must be less than 30s,
	//         otherwise developers will run them less often.
	//
	// * Isolated: the outcome of the test must only depend on the behavior of a
	//             single module.
	//
	// * Repeatable: tests must be deterministic, and must not depend on the
	//               environment (e.g must not interact with the outside world).
	//
	// * Self-Validating: the test result must be "Yes" or "No". It must not be
	//                    "Maybe", or some number that must be manually checked.
	//
	// * Timely: tests must look like they were written *before* the production
	//           code: this way, the API of the production code is designed
	//           from the point of view of the user of the API, not the implementer.
	//
	int type; // 0:first class, 1:second class

	// for sorting
	std::string file;
	int line;
};

std::vector<UnitTest>& allTests() {
	static std::vector<UnitTest> all;
	return all;
}

struct Filter {
	int minIdx = 0;
	int maxIdx = INT_MAX;
	bool noSecondClass = true;
	std::string prefix;
};

void listAll() {
	int i=0;
	for (auto& test : allTests())
		std::cout << "Test #" << i++ << ": " << test.name << std::endl;
}

bool startsWith(std::string s, std::string prefix) {
	return s.substr(0, prefix.size()) == prefix;
}

bool matches(Filter filter, int idx) {
	if(idx < filter.minIdx)
		return false;
	if(idx > filter.maxIdx)
		return false;
	if(filter.noSecondClass && allTests()[idx].type == 1)
		return false;
	if(startsWith(allTests()[idx].name, "[DISABLED]"))
		return false;
	if(!startsWith(allTests()[idx].name, filter.prefix))
		return false;
	return true;
}

void RunAll(Filter filter) {
	int count = 0;
	for(int i=0; i < (int)allTests().size(); ++i) {
		if(matches(filter, i)) {
			std::cout << "#" << i << ": " << allTests()[i].name << std::endl;
			allTests()[i].fn();
			++count;
		}
	}
	std::cout << count << " test(s) passed" << std::endl;
}

void SortTests() {
	auto byName = [](UnitTest const& a, UnitTest const& b) -> bool {
		if(a.file != b.file)
			return a.file < b.file;
		return a.line < b.line;
	};
	std::sort(allTests().begin(), allTests().end(), byName);
}
}

namespace Tests {

void Fail(char const* file, int line, const char* msg) {
	std::cerr << "TEST FAILED: " << file << "(" << line << "): " << msg << std::endl;
	std::raise(SIGABRT);
}

int RegisterTest(void (*fn)(), const char* testName, int type, const char* filename, int line) {
	UnitTest test {};
	test.fn = fn;
	test.name = testName;
	test.type = type;
	test.file = filename;
	test.line = line;
	allTests().push_back(test);
	return 0;
}
}

int main(int argc, const char* argv[]) {
	int i = 1;
	auto popWord = [&]() -> std::string {
		if(i >= argc)
			throw std::runtime_error("unexpected end of command line");
		return argv[i++];
	};

	SortTests();

	Filter filter;

	while(i < argc) {
		auto const word = popWord();

		if(word == "--list" || word == "-l") {
			listAll();
			return 0;
		} else if(word == "--only") {
			auto idx = atoi(popWord().c_str());
			filter.minIdx = idx;
			filter.maxIdx = idx;
			filter.noSecondClass = false;
		} else if(word == "--range") {
			filter.minIdx =  atoi(popWord().c_str());
			filter.maxIdx =  atoi(popWord().c_str());
		} else if(word == "--second-class") {
			filter.noSecondClass = false;
		} else if(word == "--prefix") {
			filter.prefix = popWord();
		} else {
			std::cerr << "unknown option '" << word << "'" << std::endl;
			return 1;
		}
	}

	RunAll(filter);
	return 0;
}
