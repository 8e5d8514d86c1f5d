#pragma once

#include "lib_utils/log_sink.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace Captioner {

// A font file of the custom fonts directory.
struct CustomFont {
	std::string name; // file name without extension
	std::string family; // as reported by the font file, empty if it couldn't be queried
};

// Where the font names come from. Failures must be reported as empty lists.
struct IFontSource {
	virtual ~IFontSource() {}
	virtual std::vector<std::string> systemFamilies() = 0;
	virtual std::vector<CustomFont> customFonts() = 0;
};

// Names accepted as 'font_family'. Scanned lazily, then cached until invalidate().
// Shared by all requests of the process.
class FontCatalog {
	public:
		FontCatalog(IFontSource* source, LogSink* log);

		// system families + custom file names (+ the ARIAL* aliases when Arial is present)
		std::vector<std::string> availableFontNames();

		// case-insensitive
		bool contains(std::string const& name);

		// Font name to write in the ASS style line: the family of the matching custom
		// font file if any, otherwise the name itself. Never contains a comma.
		std::string resolveAssFamily(std::string const& name);

		// Throws FontUnavailableError when !contains(name).
		void require(std::string const& name);

		// next query re-scans the source
		void invalidate();

	private:
		void scanIfNeeded();

		IFontSource* const source;
		LogSink* const m_log;

		std::mutex mutex;
		bool scanned = false;
		std::vector<std::string> names;
		std::vector<CustomFont> custom;
};

}
