#include "orchestrator.hpp"
#include "ass_header.hpp"
#include "caption_source.hpp"
#include "errors.hpp"
#include "exclusion_filter.hpp"
#include "style_handlers.hpp"
#include "style_options.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/os.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

json::Value CaptionResult::toJson() const {
	json::Value r;
	r.type = json::Value::Type::Object;
	if (ok()) {
		r.objectValue["path"] = json::makeString(path);
		return r;
	}

	r.objectValue["error"] = json::makeString(error);
	if (hasAvailableFonts) {
		std::vector<json::Value> fonts;
		for (auto& name : availableFonts)
			fonts.push_back(json::makeString(name));
		r.objectValue["available_fonts"] = json::makeArray(fonts);
	}
	return r;
}

namespace {

// Prefixes every message with the job id.
struct JobLog : LogSink {
	JobLog(LogSink* parent, std::string const& jobId) : parent(parent), prefix("Job " + jobId + ": ") {
		m_logLevel = parent->m_logLevel;
	}

	void send(Level level, const char* msg) override {
		parent->log(level, (prefix + msg).c_str());
	}

	LogSink* const parent;
	std::string const prefix;
};

// file name of the last path component of an URL, without the query
std::string urlFileName(std::string const& url) {
	auto path = url.substr(0, url.find_first_of("?#"));
	auto const slash = path.rfind('/');
	if (slash != std::string::npos)
		path = path.substr(slash + 1);
	if (path.empty() || path.find("..") != std::string::npos)
		return "media";
	return path;
}

}

// State of one request. The work directory and what it contains are removed on destruction.
struct Orchestrator::Job {
	Job(CaptionRequest const& request, LogSink* parentLog)
		: request(request), log(parentLog, request.jobId) {
	}

	~Job() {
		if (!downloadedFile.empty() && fileExists(downloadedFile))
			tryRun([&]() { removeFile(downloadedFile); });
		if (!workDir.empty() && dirExists(workDir))
			tryRun([&]() { removeDir(workDir); });
	}

	template<typename Lambda>
	void tryRun(Lambda f) {
		try {
			f();
		} catch (std::exception const& e) {
			log.log(Warning, format("Cleanup failed: %s", e.what()).c_str());
		}
	}

	CaptionRequest const& request;
	JobLog log;

	bool hasMedia = false;
	std::string media;
	std::string workDir;
	std::string downloadedFile;
};

Orchestrator::Orchestrator(OrchestratorConfig const& cfg, FontCatalog& fonts, IFilePuller* puller,
    IVideoProbe* probe, ITranscriber* transcriber, LogSink* log)
	: cfg(cfg), fonts(fonts), puller(puller), probe(probe), transcriber(transcriber), m_log(log) {
}

CaptionResult Orchestrator::run(CaptionRequest const& request) {
	CaptionResult r;
	try {
		Job job(request, m_log);
		r.path = generate(job);
	} catch (FontUnavailableError const& e) {
		r.error = e.what();
		r.hasAvailableFonts = true;
		r.availableFonts = e.availableFonts;
	} catch (std::exception const& e) {
		r.error = e.what();
	}

	if (!r.ok())
		m_log->log(Error, format("Job %s: %s", request.jobId, r.error).c_str());
	return r;
}

std::string Orchestrator::generate(Job& job) {
	auto& request = job.request;
	auto log = &job.log;

	if (!isValidJobId(request.jobId))
		throw ValidationError(format("Invalid job id '%s'.", request.jobId));

	auto const ranges = normalizeExcludeRanges(request.excludeTimeRanges);
	auto options = normalizeStyleOptions(request.settings, log);
	auto const replaceDict = normalizeReplaceRules(request.replace, log);

	fonts.require(options.fontFamily);
	log->log(Info, format("Font '%s' is available.", options.fontFamily).c_str());

	auto const source = classifyCaptionSource(fetchCaptions(job));
	log->log(Info, format("Caption source: %s.", kindName(source.kind)).c_str());

	std::string content;
	if (source.kind == CaptionSource::Ass) {
		content = source.content;
	} else {
		if (source.kind == CaptionSource::Srt && options.style != "classic")
			throw FormatError("Only 'classic' style is supported for SRT captions.");

		Resolution video;
		if (request.hasPlayRes) {
			video = request.playRes;
			log->log(Info, format("Using provided PlayResX/PlayResY = %sx%s", video.width, video.height).c_str());
		} else {
			video = probe->resolution(mediaPath(job));
			log->log(Info, format("Video resolution detected = %sx%s", video.width, video.height).c_str());
		}
		options = withDefaultFontSize(options, video.height);

		TranscriptionResult transcription;
		switch (source.kind) {
		case CaptionSource::Srt:
			transcription = srtToTranscription(source.content);
			break;
		case CaptionSource::PlainText: {
			double duration = 0;
			auto const hasDuration = probe->duration(mediaPath(job), duration);
			transcription = plainTextToTranscription(source.content, hasDuration, duration, log);
			break;
		}
		default:
			log->log(Info, "No captions provided, generating transcription.");
			transcription = transcriber->transcribe(mediaPath(job), request.language);
			break;
		}

		auto const style = parseStyle(options.style, log);
		log->log(Info, format("Using style '%s' for captioning.", styleName(style)).c_str());

		StyleHeaderBuilder header(fonts, log);
		content = header.build(options, video);
		content += renderDialogues(style, transcription, options, replaceDict, video, log) + "\n";
	}

	if (!ranges.empty()) {
		content = filterSubtitleLines(content, ranges, SubtitleKind::Ass);
		log->log(Info, "Filtered ASS Dialogue lines due to exclude_time_ranges.");
	}

	return persist(job, content);
}

std::string Orchestrator::fetchCaptions(Job& job) {
	auto const& captions = job.request.captions;
	if (captions.empty() || !isUrl(captions))
		return captions;

	job.log.log(Info, "Captions provided as URL. Downloading captions.");
	try {
		return download(puller, trim(captions));
	} catch (std::exception const& e) {
		throw SourceRetrievalError(format("Failed to download captions: %s", e.what()));
	}
}

std::string const& Orchestrator::mediaPath(Job& job) {
	if (job.hasMedia)
		return job.media;

	auto const& url = job.request.videoUrl;
	if (trim(url).empty())
		throw ValidationError("'video_url' is required to process these captions.");

	if (isUrl(url)) {
		try {
			mkdirIfMissing(cfg.storageDir);
			job.workDir = cfg.storageDir + "/" + job.request.jobId + ".work";
			mkdirIfMissing(job.workDir);
			job.downloadedFile = job.workDir + "/" + urlFileName(url);
			downloadToFile(puller, trim(url), job.downloadedFile);
		} catch (std::exception const& e) {
			throw SourceRetrievalError(format("Video download error: %s", e.what()));
		}
		job.media = job.downloadedFile;
		job.log.log(Info, format("Video downloaded to %s", job.media).c_str());
	} else {
		if (!fileExists(url))
			throw SourceRetrievalError(format("Video file '%s' not found.", url));
		job.media = url;
	}

	job.hasMedia = true;
	return job.media;
}

std::string Orchestrator::persist(Job& job, std::string const& content) {
	auto const path = cfg.storageDir + "/" + job.request.jobId + ".ass";
	auto const tmpPath = path + ".tmp";
	try {
		mkdirIfMissing(cfg.storageDir);
		writeFile(tmpPath, content);
		moveFile(tmpPath, path);
	} catch (std::exception const& e) {
		if (fileExists(tmpPath))
			job.tryRun([&]() { removeFile(tmpPath); });
		throw PersistenceError(format("Failed to save subtitle file: %s", e.what()));
	}
	job.log.log(Info, format("Subtitle file saved to %s", path).c_str());
	return path;
}

}
