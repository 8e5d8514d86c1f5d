#include "lib_appcommon/options.hpp"
#include "lib_captioner/orchestrator.hpp"
#include "lib_media/common/http_puller.hpp"
#include "lib_media/fonts/fontconfig_source.hpp"
#include "lib_media/probe/libav_probe.hpp"
#include "lib_media/transcribe/whisper_transcript.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"
#include "config.hpp"
#include <ctime>
#include <iostream>

const char *g_appName = "captioner";
const char *g_version = "1.0.0";

using namespace Captioner;

namespace {
Config parseCommandLine(int argc, char const* argv[]) {

	Config cfg;
	cfg.fontsDir = getEnvironmentVariable("CAPTIONER_FONTS_DIR");

	CmdLineOptions opt;
	opt.add("o", "output-dir", &cfg.outputDir, "Set the directory of the generated subtitles (default: ./output).");
	opt.add("f", "fonts-dir", &cfg.fontsDir, "Set the directory of the custom .ttf/.otf fonts (default: $CAPTIONER_FONTS_DIR).");
	opt.add("t", "transcript", &cfg.transcriptPath, "Whisper JSON transcript of the video (default: <video>.json).");
	opt.add("j", "job-id", &cfg.jobId, "Job id, when the request has none (default: generated).");
	opt.add("l", "log-level", &cfg.logLevel, "Log level: quiet, error, warning, info, debug.");
	opt.add("", "log-csv", &cfg.logCsv, "Write the logs as CSV to this file.");
	opt.addFlag("", "no-color", &cfg.noColor, "Disable colors in console logs.");
	opt.addFlag("h", "help", &cfg.help, "Print usage and exit.");

	auto args = opt.parse(argc, argv);

	if(cfg.help) {
		std::cout << g_appName << " " << g_version << std::endl;
		std::cout << "Usage: " << g_appName << " [options] <request.json>" << std::endl << "Options:" << std::endl;
		opt.printHelp(std::cout);
		std::cout << std::endl
		    << "Prints the path of the generated ASS file. On failure, prints the error as JSON and exits with 1." << std::endl
		    << "Example:" << std::endl
		    << "  " << g_appName << " -o /tmp/subs -t talk.json request.json" << std::endl;
		return cfg;
	}

	if(args.size() != 1)
		throw std::runtime_error("Must give exactly one request file");

	cfg.requestPath = args[0];

	if(cfg.jobId.empty())
		cfg.jobId = format("captions_%s_%s", (long long)std::time(nullptr), getPid());

	return cfg;
}

void setupLogs(Config const& cfg) {
	if(!cfg.logCsv.empty())
		setGlobalLogCSV(cfg.logCsv.c_str());
	else if(cfg.noColor)
		setGlobalLogConsole(false);

	if(!cfg.logLevel.empty())
		setGlobalLogLevel(parseLogLevel(cfg.logLevel.c_str()));
}
}

int safeMain(int argc, const char* argv[]) {
	auto const cfg = parseCommandLine(argc, argv);
	if(cfg.help)
		return 0;

	setupLogs(cfg);

	Media::FontconfigSource fontSource(cfg.fontsDir, g_Log);
	FontCatalog fonts(&fontSource, g_Log);
	auto puller = Media::createHttpSource();
	Media::LibavProbe probe(g_Log);
	Media::WhisperJsonTranscriber transcriber(cfg.transcriptPath, g_Log);

	OrchestratorConfig orchestratorCfg;
	orchestratorCfg.storageDir = cfg.outputDir;
	Orchestrator orchestrator(orchestratorCfg, fonts, puller.get(), &probe, &transcriber, g_Log);

	CaptionResult result;
	try {
		auto const request = parseCaptionRequest(json::parse(readFile(cfg.requestPath)), cfg.jobId);
		result = orchestrator.run(request);
	} catch(std::exception const& e) {
		result.error = format("Invalid request: %s", e.what());
		g_Log->log(Error, result.error.c_str());
	}

	if(!result.ok()) {
		std::cout << json::serialize(result.toJson()) << std::endl;
		return 1;
	}

	std::cout << result.path << std::endl;
	return 0;
}
