#pragma once

#include "transcription.hpp" // Resolution
#include "lib_utils/json.hpp"
#include <string>

namespace Captioner {

// One captioning job, as received. 'settings', 'replace' and 'excludeTimeRanges' are
// kept raw: the orchestrator validates them in order.
struct CaptionRequest {
	std::string videoUrl; // URL or local path
	std::string captions; // empty: none
	json::Value settings;
	json::Value replace;
	json::Value excludeTimeRanges;
	std::string jobId;
	std::string language = "auto";

	// explicit PlayResX/PlayResY
	bool hasPlayRes = false;
	Resolution playRes;

	CaptionRequest();
};

// Throws ValidationError. 'defaultJobId' is used when the document has neither 'id' nor 'job_id'.
CaptionRequest parseCaptionRequest(json::Value const& doc, std::string const& defaultJobId);

// letters, digits, '_', '-' and '.', not "." nor ".."
bool isValidJobId(std::string const& id);

}
