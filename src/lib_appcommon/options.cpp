#include <cstdlib>
#include <stdexcept>
#include "options.hpp"

std::string safePop(ArgQueue& args) {
	if(args.empty())
		throw std::runtime_error("unexpected end of command line");
	auto val = args.front();
	args.pop();
	return val;
}

std::vector<std::string> CmdLineOptions::parse(int argc, const char* argv[]) {

	std::vector<std::string> remaining;

	ArgQueue args;
	for(int i = 1; i < argc; ++i) // skip argv[0]
		args.push(argv[i]);

	while(!args.empty()) {
		auto word = args.front();
		args.pop();

		if(word.size() < 2 || word[0] != '-') {
			remaining.push_back(word);
			continue;
		}

		AbstractOption* opt = nullptr;

		for(auto& o : m_Options) {
			if((!o->shortName.empty() && word == o->shortName) || word == o->longName) {
				opt = o.get();
				break;
			}
		}

		if(!opt)
			throw std::runtime_error("unknown option: \"" + word + "\"");

		opt->parse(args);
	}

	return remaining;
}

void CmdLineOptions::printHelp(std::ostream& out) {
	for(auto& o : m_Options) {
		auto s = o->shortName.empty() ? "    " + o->longName : o->shortName + ", " + o->longName;
		while(s.size()< 40)
			s += " ";
		out << "    " << s << o->desc << std::endl;
	}
}

void parseValue(double& var, ArgQueue& args) {
	auto const word = safePop(args);
	char* end = nullptr;
	var = strtod(word.c_str(), &end);
	if(word.empty() || *end != 0)
		throw std::runtime_error("invalid number: \"" + word + "\"");
}

void parseValue(int& var, ArgQueue& args) {
	auto const word = safePop(args);
	char* end = nullptr;
	var = (int)strtol(word.c_str(), &end, 10);
	if(word.empty() || *end != 0)
		throw std::runtime_error("invalid integer: \"" + word + "\"");
}

void parseValue(bool& var, ArgQueue&) {
	var = true;
}

void parseValue(std::string& var, ArgQueue& args) {
	var = safePop(args);
}

void parseValue(std::vector<std::string>& var, ArgQueue& args) {
	var.clear();
	while(!args.empty() && args.front()[0] != '-') {
		var.push_back(safePop(args));
	}
}
