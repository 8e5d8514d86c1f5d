#include "tests/tests.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_captioner/request.hpp"

using namespace Captioner;

namespace {

CaptionRequest parse(const char* text) {
	return parseCaptionRequest(json::parse(text), "default_id");
}

unittest("parseCaptionRequest: defaults") {
	auto const r = parse(R"({ "video_url": "https://example.com/v.mp4" })");
	ASSERT_EQUALS("https://example.com/v.mp4", r.videoUrl);
	ASSERT_EQUALS("", r.captions);
	ASSERT_EQUALS("auto", r.language);
	ASSERT_EQUALS("default_id", r.jobId);
	ASSERT(r.settings.type == json::Value::Type::Object);
	ASSERT(r.replace.type == json::Value::Type::Array);
	ASSERT(r.excludeTimeRanges.type == json::Value::Type::Array);
	ASSERT(!r.hasPlayRes);
}

unittest("parseCaptionRequest: all fields") {
	auto const r = parse(R"({
		"video_url": "/media/v.mp4",
		"captions": "Hello",
		"language": "fr",
		"job_id": "job-42",
		"settings": { "style": "karaoke" },
		"replace": [ { "find": "a", "replace": "b" } ],
		"exclude_time_ranges": [ { "start": "0:01", "end": "0:02" } ],
		"PlayResX": 1280,
		"PlayResY": 720
	})");
	ASSERT_EQUALS("/media/v.mp4", r.videoUrl);
	ASSERT_EQUALS("Hello", r.captions);
	ASSERT_EQUALS("fr", r.language);
	ASSERT_EQUALS("job-42", r.jobId);
	ASSERT_EQUALS("karaoke", r.settings["style"].stringValue);
	ASSERT_EQUALS(1u, r.replace.arrayValue.size());
	ASSERT_EQUALS(1u, r.excludeTimeRanges.arrayValue.size());
	ASSERT(r.hasPlayRes);
	ASSERT_EQUALS(1280, r.playRes.width);
	ASSERT_EQUALS(720, r.playRes.height);
}

unittest("parseCaptionRequest: 'id' wins over 'job_id'") {
	ASSERT_EQUALS("first", parse(R"({ "id": "first", "job_id": "second" })").jobId);
}

unittest("parseCaptionRequest: null values are ignored") {
	auto const r = parse(R"({ "captions": null, "settings": null, "language": null })");
	ASSERT_EQUALS("", r.captions);
	ASSERT_EQUALS("auto", r.language);
	ASSERT(r.settings.type == json::Value::Type::Object);
}

unittest("parseCaptionRequest: a single PlayRes dimension is ignored") {
	ASSERT(!parse(R"({ "PlayResX": 1280 })").hasPlayRes);
}

unittest("parseCaptionRequest: raw settings are validated later") {
	auto const r = parse(R"({ "settings": "bold", "replace": 3 })");
	ASSERT(r.settings.type == json::Value::Type::String);
	ASSERT(r.replace.type == json::Value::Type::Integer);
}

unittest("parseCaptionRequest: invalid requests") {
	ASSERT_THROWN(parse(R"({ "video_url": 12 })"));
	ASSERT_THROWN(parse(R"({ "captions": ["a"] })"));
	ASSERT_THROWN(parse(R"({ "id": "../etc/passwd" })"));
	ASSERT_THROWN(parse(R"({ "PlayResX": 0, "PlayResY": 720 })"));
	ASSERT_THROWN(parse(R"({ "PlayResX": "1280", "PlayResY": 720 })"));
	ASSERT_THROWN(parseCaptionRequest(json::parse("{}"), ""));
}

unittest("parseCaptionRequest: error message") {
	try {
		parse(R"({ "PlayResX": 1280, "PlayResY": -1 })");
		ASSERT(0);
	} catch (ValidationError const& e) {
		ASSERT_EQUALS("'PlayResY' should be a positive integer.", std::string(e.what()));
	}
}

unittest("isValidJobId") {
	ASSERT(isValidJobId("captions_1700000000_42"));
	ASSERT(isValidJobId("a.b-c_D"));
	ASSERT(!isValidJobId(""));
	ASSERT(!isValidJobId("."));
	ASSERT(!isValidJobId(".."));
	ASSERT(!isValidJobId("a/b"));
	ASSERT(!isValidJobId("a b"));
}

}
