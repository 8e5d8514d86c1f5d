#include "request.hpp"
#include "errors.hpp"
#include "lib_utils/format.hpp"

namespace Captioner {

CaptionRequest::CaptionRequest() {
	settings.type = json::Value::Type::Object;
	replace.type = json::Value::Type::Array;
	excludeTimeRanges.type = json::Value::Type::Array;
}

bool isValidJobId(std::string const& id) {
	if (id.empty() || id == "." || id == "..")
		return false;
	for (auto c : id) {
		auto const ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
		    || c == '_' || c == '-' || c == '.';
		if (!ok)
			return false;
	}
	return true;
}

namespace {

bool has(json::Value const& doc, const char* key) {
	return doc.has(key) && !doc[key].isNull();
}

std::string getString(json::Value const& doc, const char* key) {
	auto const& v = doc[key];
	if (v.type != json::Value::Type::String)
		throw ValidationError(format("'%s' should be a string.", key));
	return v.stringValue;
}

int getPositiveInt(json::Value const& doc, const char* key) {
	auto const& v = doc[key];
	if (v.type != json::Value::Type::Integer || v.intValue <= 0)
		throw ValidationError(format("'%s' should be a positive integer.", key));
	return v.intValue;
}

}

CaptionRequest parseCaptionRequest(json::Value const& doc, std::string const& defaultJobId) {
	if (doc.type != json::Value::Type::Object)
		throw ValidationError("The request should be a JSON object.");

	CaptionRequest r;

	if (has(doc, "video_url"))
		r.videoUrl = getString(doc, "video_url");
	if (has(doc, "captions"))
		r.captions = getString(doc, "captions");
	if (has(doc, "language"))
		r.language = getString(doc, "language");
	if (r.language.empty())
		r.language = "auto";

	if (has(doc, "settings"))
		r.settings = doc["settings"];
	if (has(doc, "replace"))
		r.replace = doc["replace"];
	if (has(doc, "exclude_time_ranges"))
		r.excludeTimeRanges = doc["exclude_time_ranges"];

	r.jobId = defaultJobId;
	if (has(doc, "id"))
		r.jobId = getString(doc, "id");
	else if (has(doc, "job_id"))
		r.jobId = getString(doc, "job_id");
	if (!isValidJobId(r.jobId))
		throw ValidationError(format("Invalid job id '%s'.", r.jobId));

	if (has(doc, "PlayResX") && has(doc, "PlayResY")) {
		r.hasPlayRes = true;
		r.playRes.width = getPositiveInt(doc, "PlayResX");
		r.playRes.height = getPositiveInt(doc, "PlayResY");
	}

	return r;
}

}
