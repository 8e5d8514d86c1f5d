#pragma once

// Interfaces of the external tools the captioning pipeline relies on.
// Implementations live in lib_media.

#include "transcription.hpp"
#include "lib_utils/span.hpp"
#include <functional>
#include <memory>
#include <string>

namespace Captioner {

struct IVideoProbe {
	virtual ~IVideoProbe() = default;

	// default Resolution (384x288) when the file can't be probed
	virtual Resolution resolution(std::string const& path) = 0;

	// returns false when the duration is unknown
	virtual bool duration(std::string const& path, double& seconds) = 0;
};

struct ITranscriber {
	virtual ~ITranscriber() = default;

	// word-level timings; 'language' is "auto" or a language code
	virtual TranscriptionResult transcribe(std::string const& mediaPath, std::string const& language) = 0;
};

struct IFilePuller {
	virtual ~IFilePuller() = default;

	// throws std::runtime_error on network or HTTP errors
	virtual void wget(const char* url, std::function<void(SpanC)> callback) = 0;
};

std::string download(IFilePuller* puller, std::string const& url);

// streams 'url' into 'path'
void downloadToFile(IFilePuller* puller, std::string const& url, std::string const& path);

bool isUrl(std::string const& s);

}
