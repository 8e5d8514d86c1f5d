#pragma once

#include "collaborators.hpp"
#include "font_catalog.hpp"
#include "request.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>
#include <vector>

namespace Captioner {

// Either the path of the generated file, or an error.
struct CaptionResult {
	std::string path;

	std::string error;
	bool hasAvailableFonts = false; // font errors only
	std::vector<std::string> availableFonts;

	bool ok() const {
		return error.empty();
	}

	// {"path": ...} or {"error": ..., "available_fonts": [...]}
	json::Value toJson() const;
};

struct OrchestratorConfig {
	std::string storageDir; // output files and per-job work directories
};

// Runs a captioning request from the validation of its parameters to the
// persistence of the resulting ASS file: "<storageDir>/<jobId>.ass".
class Orchestrator {
	public:
		Orchestrator(OrchestratorConfig const& cfg, FontCatalog& fonts, IFilePuller* puller,
		    IVideoProbe* probe, ITranscriber* transcriber, LogSink* log);

		// Never throws: any failure is reported in the result, and no output file is left behind.
		CaptionResult run(CaptionRequest const& request);

	private:
		struct Job;

		std::string generate(Job& job);
		std::string fetchCaptions(Job& job);
		std::string const& mediaPath(Job& job);
		std::string persist(Job& job, std::string const& content);

		OrchestratorConfig const cfg;
		FontCatalog& fonts;
		IFilePuller* const puller;
		IVideoProbe* const probe;
		ITranscriber* const transcriber;
		LogSink* const m_log;
};

}
