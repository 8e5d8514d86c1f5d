#pragma once

#include "font_catalog.hpp"
#include "style_options.hpp"
#include "transcription.hpp" // Resolution
#include "lib_utils/log_sink.hpp"
#include <string>

namespace Captioner {

// Builds the [Script Info], [V4+ Styles] and [Events] sections of an ASS document.
// The only style is "Default", events override its alignment.
class StyleHeaderBuilder {
	public:
		StyleHeaderBuilder(FontCatalog& fonts, LogSink* log);

		// Throws FontUnavailableError when the requested font family is unknown.
		// 'options.fontSize' must have been resolved (see withDefaultFontSize()).
		std::string build(StyleOptions const& options, Resolution const& video);

		std::string styleLine(StyleOptions const& options);

	private:
		FontCatalog& fonts;
		LogSink* const m_log;
};

}
