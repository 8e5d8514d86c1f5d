#include "tests/tests.hpp"
#include "lib_captioner/orchestrator.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"
#include "stubs.hpp"

using namespace Captioner;
using namespace Captioner::Stubs;

namespace {

const char* const srtDoc =
    "1\n"
    "00:00:00,500 --> 00:00:01,500\n"
    "first\n"
    "\n"
    "2\n"
    "00:00:03,000 --> 00:00:04,000\n"
    "second\n";

const char* const assDoc =
    "[Script Info]\n"
    "ScriptType: v4.00+\n"
    "\n"
    "[Events]\n"
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n"
    "Dialogue: 0,0:00:00.00,0:00:01.00,Default,,0,0,0,,one\n"
    "Dialogue: 0,0:00:05.00,0:00:06.00,Default,,0,0,0,,two\n";

size_t countOf(std::string const& haystack, std::string const& needle) {
	size_t n = 0;
	for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
		++n;
	return n;
}

// A fresh storage directory with stub collaborators, removed on destruction.
struct Fixture {
	Fixture(const char* name)
		: dir(format("/tmp/captioner_orch_%s_%s", getPid(), name)), storageDir(dir), fonts(&fontSource, getNullLog()) {
		mkdirIfMissing(dir);
		probe.res.width = 1920;
		probe.res.height = 1080;
		transcriber.result.segments.push_back(segment(0, 1, "Hello world", { word("Hello", 0, 0.5), word("world", 0.5, 1) }));
	}

	~Fixture() {
		for (auto& entry : listDir(dir))
			removeFile(dir + "/" + entry);
		removeDir(dir);
	}

	CaptionResult run(const char* requestJson, std::string const& captions = "") {
		auto request = parseCaptionRequest(json::parse(requestJson), "job");
		if (!captions.empty())
			request.captions = captions;

		OrchestratorConfig cfg;
		cfg.storageDir = storageDir;
		Orchestrator orchestrator(cfg, fonts, &puller, &probe, &transcriber, getNullLog());
		return orchestrator.run(request);
	}

	std::string const dir;
	std::string storageDir;
	StubFontSource fontSource;
	FontCatalog fonts;
	StubPuller puller;
	StubProbe probe;
	StubTranscriber transcriber;
};

unittest("Orchestrator: transcription of a remote video") {
	Fixture f("transcribe");
	auto const url = "https://example.com/media/clip.mp4?token=1";
	f.puller.bodies[url] = "not really a video";

	auto const r = f.run(R"({ "video_url": "https://example.com/media/clip.mp4?token=1", "language": "en", "settings": { "style": "karaoke" } })");
	ASSERT(r.ok());
	ASSERT_EQUALS(f.dir + "/job.ass", r.path);

	ASSERT_EQUALS(1, f.transcriber.calls);
	ASSERT_EQUALS("en", f.transcriber.lastLanguage);
	ASSERT_EQUALS(f.dir + "/job.work/clip.mp4", f.transcriber.lastMedia);
	ASSERT(!dirExists(f.dir + "/job.work"));

	auto const content = readFile(r.path);
	ASSERT_EQUALS(0u, content.find("[Script Info]\n"));
	ASSERT(content.find("PlayResX: 1920\nPlayResY: 1080\n") != std::string::npos);
	ASSERT(content.find("Style: Default,Arial,54,") != std::string::npos);
	ASSERT(content.find("{\\k50}Hello {\\k50}world\n") != std::string::npos);
	ASSERT(!fileExists(r.path + ".tmp"));
}

unittest("Orchestrator: storage directory is created on the first download") {
	Fixture f("fresh_storage");
	f.storageDir = f.dir + "/output";
	f.puller.bodies["https://example.com/v.mp4"] = "data";

	auto const r = f.run(R"({ "video_url": "https://example.com/v.mp4" })");
	ASSERT_EQUALS("", r.error);
	ASSERT_EQUALS(f.storageDir + "/job.ass", r.path);
	ASSERT_EQUALS(f.storageDir + "/job.work/v.mp4", f.transcriber.lastMedia);
	ASSERT(!dirExists(f.storageDir + "/job.work"));

	removeFile(r.path);
	removeDir(f.storageDir);
}

unittest("Orchestrator: the video is downloaded once") {
	Fixture f("download_once");
	f.puller.bodies["http://example.com/v.mp4"] = "data";

	auto const r = f.run(R"({ "video_url": "http://example.com/v.mp4" })", "Some plain text");
	ASSERT(r.ok());
	ASSERT_EQUALS(1u, f.puller.requested.size());
	ASSERT_EQUALS(2u, f.probe.probed.size());
	ASSERT_EQUALS(0, f.transcriber.calls);
}

unittest("Orchestrator: plain text over the whole video") {
	Fixture f("plain_text");
	writeFile(f.dir + "/video.mp4", "data");
	f.probe.mediaDuration = 12;

	auto const request = format(R"({ "video_url": "%s/video.mp4" })", f.dir);
	auto const r = f.run(request.c_str(), "Welcome");
	ASSERT(r.ok());
	ASSERT(readFile(r.path).find("Dialogue: 0,0:00:00.00,0:00:12.00,Default,,0,0,0,,{\\an5\\pos(960,540)}Welcome\n") != std::string::npos);
	ASSERT(fileExists(f.dir + "/video.mp4"));
}

unittest("Orchestrator: explicit PlayRes skips the probe") {
	Fixture f("playres");
	auto const r = f.run(R"({ "PlayResX": 1280, "PlayResY": 720, "settings": { "font_size": 40 } })", srtDoc);
	ASSERT(r.ok());
	ASSERT(f.probe.probed.empty());

	auto const content = readFile(r.path);
	ASSERT(content.find("PlayResX: 1280\nPlayResY: 720\n") != std::string::npos);
	ASSERT(content.find("Style: Default,Arial,40,") != std::string::npos);
	ASSERT_EQUALS(2u, countOf(content, "Dialogue: "));
}

unittest("Orchestrator: SRT captions only support the classic style") {
	Fixture f("srt_karaoke");
	auto const r = f.run(R"({ "PlayResX": 1280, "PlayResY": 720, "settings": { "style": "karaoke" } })", srtDoc);
	ASSERT(!r.ok());
	ASSERT_EQUALS("Only 'classic' style is supported for SRT captions.", r.error);
	ASSERT(!fileExists(f.dir + "/job.ass"));
	ASSERT_EQUALS(0, f.transcriber.calls);
}

unittest("Orchestrator: ASS captions are used as is") {
	Fixture f("ass");
	auto const r = f.run("{}", assDoc);
	ASSERT(r.ok());
	ASSERT_EQUALS(assDoc, readFile(r.path));
	ASSERT(f.probe.probed.empty());
}

unittest("Orchestrator: excluded time ranges") {
	Fixture f("exclude");
	auto const r = f.run(R"({ "exclude_time_ranges": [ { "start": "0:04", "end": "0:10" } ] })", assDoc);
	ASSERT(r.ok());

	auto const content = readFile(r.path);
	ASSERT(content.find(",one\n") != std::string::npos);
	ASSERT(content.find(",two") == std::string::npos);
}

unittest("Orchestrator: excluded time ranges on SRT captions") {
	Fixture f("exclude_srt");
	auto const r = f.run(R"({ "PlayResX": 640, "PlayResY": 480, "exclude_time_ranges": [ { "start": "0:01", "end": "0:02" } ] })", srtDoc);
	ASSERT(r.ok());

	auto const content = readFile(r.path);
	ASSERT_EQUALS(1u, countOf(content, "Dialogue: "));
	ASSERT(content.find("second") != std::string::npos);
}

unittest("Orchestrator: captions from an URL") {
	Fixture f("caption_url");
	f.puller.bodies["https://example.com/subs.srt"] = srtDoc;
	auto const r = f.run(R"({ "PlayResX": 640, "PlayResY": 480 })", "https://example.com/subs.srt");
	ASSERT(r.ok());
	ASSERT_EQUALS(2u, countOf(readFile(r.path), "Dialogue: "));
}

unittest("Orchestrator: captions URL can't be downloaded") {
	Fixture f("caption_url_error");
	auto const r = f.run("{}", "https://example.com/missing.srt");
	ASSERT(!r.ok());
	ASSERT_EQUALS(0u, r.error.find("Failed to download captions: "));
	ASSERT(!fileExists(f.dir + "/job.ass"));
}

unittest("Orchestrator: video can't be downloaded") {
	Fixture f("video_error");
	auto const r = f.run(R"({ "video_url": "https://example.com/missing.mp4" })");
	ASSERT(!r.ok());
	ASSERT_EQUALS(0u, r.error.find("Video download error: "));
	ASSERT(!dirExists(f.dir + "/job.work"));
}

unittest("Orchestrator: local video not found") {
	Fixture f("video_missing");
	auto const r = f.run(R"({ "video_url": "/nonexistent/video.mp4" })");
	ASSERT_EQUALS("Video file '/nonexistent/video.mp4' not found.", r.error);
}

unittest("Orchestrator: no video and no captions") {
	Fixture f("nothing");
	auto const r = f.run("{}");
	ASSERT_EQUALS("'video_url' is required to process these captions.", r.error);
}

unittest("Orchestrator: unknown font") {
	Fixture f("font");
	auto const r = f.run(R"({ "settings": { "font_family": "Papyrus" } })", assDoc);
	ASSERT(!r.ok());
	ASSERT(r.hasAvailableFonts);
	ASSERT_EQUALS(
	    "{\"error\": \"Font 'Papyrus' not available.\", \"available_fonts\": [\"ARIALBD\", \"ARIALBI\", \"ARIALI\", \"Arial\", \"DejaVu Sans\", \"Liberation Serif\"]}",
	    json::serialize(r.toJson()));
	ASSERT(!fileExists(f.dir + "/job.ass"));
}

unittest("Orchestrator: invalid settings") {
	Fixture f("settings");
	auto const r = f.run(R"({ "settings": [1, 2] })", assDoc);
	ASSERT_EQUALS("'settings' should be a dictionary.", r.error);
	ASSERT(!r.hasAvailableFonts);
	ASSERT_EQUALS("{\"error\": \"'settings' should be a dictionary.\"}", json::serialize(r.toJson()));
}

unittest("CaptionResult: success") {
	CaptionResult r;
	r.path = "/out/job.ass";
	ASSERT(r.ok());
	ASSERT_EQUALS("{\"path\": \"/out/job.ass\"}", json::serialize(r.toJson()));
}

}
