#include "fontconfig_source.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/os.hpp"
#include "lib_utils/tools.hpp"
#include <memory>

#include <fontconfig/fontconfig.h>

namespace Media {

namespace {

// all the families of a pattern ("Name1, Name2" fonts have several)
std::vector<std::string> families(FcPattern* pattern) {
	std::vector<std::string> r;
	FcChar8* family = nullptr;
	for (int i = 0; FcPatternGetString(pattern, FC_FAMILY, i, &family) == FcResultMatch; ++i)
		r.push_back((const char*)family);
	return r;
}

bool isFontFile(std::string const& name) {
	auto const lower = toLower(name);
	return endsWith(lower, ".ttf") || endsWith(lower, ".otf");
}

bool isAliasName(std::string const& name) {
	auto const lower = toLower(name);
	return lower == "arialbd" || lower == "ariali" || lower == "arialbi";
}

}

FontconfigSource::FontconfigSource(std::string const& customFontsDir, LogSink* log)
	: customFontsDir(customFontsDir), m_log(log) {
}

std::vector<std::string> FontconfigSource::systemFamilies() {
	std::unique_ptr<FcConfig, decltype(&FcConfigDestroy)> config(FcInitLoadConfigAndFonts(), &FcConfigDestroy);
	if (!config) {
		m_log->log(Warning, "fontconfig initialization failed: no system font available.");
		return {};
	}

	std::unique_ptr<FcPattern, decltype(&FcPatternDestroy)> pattern(FcPatternCreate(), &FcPatternDestroy);
	std::unique_ptr<FcObjectSet, decltype(&FcObjectSetDestroy)> objects(FcObjectSetBuild(FC_FAMILY, nullptr), &FcObjectSetDestroy);
	if (!pattern || !objects)
		return {};

	std::unique_ptr<FcFontSet, decltype(&FcFontSetDestroy)> fonts(FcFontList(config.get(), pattern.get(), objects.get()), &FcFontSetDestroy);
	if (!fonts) {
		m_log->log(Warning, "fontconfig font listing failed: no system font available.");
		return {};
	}

	std::vector<std::string> r;
	for (int i = 0; i < fonts->nfont; ++i)
		for (auto& family : families(fonts->fonts[i]))
			r.push_back(family);

	m_log->log(Debug, format("fontconfig: %s system families", r.size()).c_str());
	return r;
}

std::vector<Captioner::CustomFont> FontconfigSource::customFonts() {
	std::vector<Captioner::CustomFont> r;
	if (customFontsDir.empty() || !dirExists(customFontsDir))
		return r;

	std::vector<std::string> fileNames;
	try {
		fileNames = listDir(customFontsDir);
	} catch (std::exception const& e) {
		m_log->log(Warning, format("Can't scan custom fonts: %s", e.what()).c_str());
		return r;
	}

	for (auto& fileName : fileNames) {
		auto const path = customFontsDir + "/" + fileName;
		if (!isFontFile(fileName) || !fileExists(path))
			continue;

		Captioner::CustomFont font;
		font.name = fileName.substr(0, fileName.rfind('.'));

		if (!isAliasName(font.name)) {
			int count = 0;
			auto pattern = FcFreeTypeQuery((const FcChar8*)path.c_str(), 0, nullptr, &count);
			if (pattern) {
				auto const names = families(pattern);
				if (!names.empty())
					font.family = trim(names[0]);
				FcPatternDestroy(pattern);
			} else {
				m_log->log(Debug, format("Can't query font file '%s'", path).c_str());
			}
		}

		r.push_back(font);
	}

	m_log->log(Info, format("Custom fonts: %s from %s", r.size(), customFontsDir).c_str());
	return r;
}

}
