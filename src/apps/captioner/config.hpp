#pragma once

#include <string>

struct Config {
	std::string requestPath;
	std::string outputDir = "./output";
	std::string fontsDir; // defaults to $CAPTIONER_FONTS_DIR
	std::string transcriptPath;
	std::string jobId;
	std::string logLevel;
	std::string logCsv;
	bool noColor = false;
	bool help = false;
};
