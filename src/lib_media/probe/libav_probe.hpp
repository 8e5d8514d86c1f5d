#pragma once

#include "lib_captioner/collaborators.hpp"
#include "lib_utils/log_sink.hpp"

namespace Media {

// Video metadata read with libavformat.
class LibavProbe : public Captioner::IVideoProbe {
	public:
		LibavProbe(LogSink* log);

		Captioner::Resolution resolution(std::string const& path) override;
		bool duration(std::string const& path, double& seconds) override;

	private:
		LogSink* const m_log;
};

}
