#pragma once

#include "lib_captioner/collaborators.hpp"
#include "lib_captioner/errors.hpp"
#include "lib_captioner/font_catalog.hpp"
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace Captioner {
namespace Stubs {

inline bool near(double a, double b) {
	return std::fabs(a - b) < 1e-6;
}

struct StubFontSource : IFontSource {
	std::vector<std::string> systemFamilies() override {
		++scans;
		return system;
	}
	std::vector<CustomFont> customFonts() override {
		return custom;
	}

	std::vector<std::string> system { "Arial", "DejaVu Sans", "Liberation Serif" };
	std::vector<CustomFont> custom;
	int scans = 0;
};

// serves canned bodies, fails on unknown URLs
struct StubPuller : IFilePuller {
	void wget(const char* url, std::function<void(SpanC)> callback) override {
		requested.push_back(url);
		auto i = bodies.find(url);
		if (i == bodies.end())
			throw std::runtime_error("HTTP error 404");
		auto const& body = i->second;
		callback({(const uint8_t*)body.data(), body.size()});
	}

	std::map<std::string, std::string> bodies;
	std::vector<std::string> requested;
};

struct StubProbe : IVideoProbe {
	Resolution resolution(std::string const& path) override {
		probed.push_back(path);
		return res;
	}
	bool duration(std::string const& path, double& seconds) override {
		probed.push_back(path);
		seconds = mediaDuration;
		return hasDuration;
	}

	Resolution res;
	bool hasDuration = true;
	double mediaDuration = 30.0;
	std::vector<std::string> probed;
};

struct StubTranscriber : ITranscriber {
	TranscriptionResult transcribe(std::string const& mediaPath, std::string const& language) override {
		++calls;
		lastMedia = mediaPath;
		lastLanguage = language;
		return result;
	}

	TranscriptionResult result;
	int calls = 0;
	std::string lastMedia, lastLanguage;
};

inline WordTiming word(std::string text, double start, double end) {
	WordTiming w;
	w.word = text;
	w.start = start;
	w.end = end;
	return w;
}

inline Segment segment(double start, double end, std::string text, std::vector<WordTiming> words = {}) {
	Segment s;
	s.start = start;
	s.end = end;
	s.text = text;
	s.words = words;
	return s;
}

}
}
