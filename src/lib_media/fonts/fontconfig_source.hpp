#pragma once

#include "lib_captioner/font_catalog.hpp"
#include "lib_utils/log_sink.hpp"
#include <string>

namespace Media {

// System fonts known to fontconfig, plus the .ttf/.otf files of a custom directory.
class FontconfigSource : public Captioner::IFontSource {
	public:
		// 'customFontsDir' may be empty or missing
		FontconfigSource(std::string const& customFontsDir, LogSink* log);

		std::vector<std::string> systemFamilies() override;
		std::vector<Captioner::CustomFont> customFonts() override;

	private:
		std::string const customFontsDir;
		LogSink* const m_log;
};

}
