#include "font_catalog.hpp"
#include "errors.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/tools.hpp"
#include <algorithm>

namespace Captioner {

namespace {
// Fontconfig resolves these file names by itself
const char* const aliasNames[] = { "ARIALBD", "ARIALI", "ARIALBI" };

bool isAlias(std::string const& name) {
	auto const upper = toUpper(name);
	for (auto alias : aliasNames)
		if (upper == alias)
			return true;
	return false;
}

void addUnique(std::vector<std::string>& names, std::string const& name) {
	if (std::find(names.begin(), names.end(), name) == names.end())
		names.push_back(name);
}

std::string firstFamily(std::string const& family) {
	return trim(split(family, ',')[0]);
}
}

FontCatalog::FontCatalog(IFontSource* source, LogSink* log)
	: source(source), m_log(log) {
}

void FontCatalog::scanIfNeeded() {
	if (scanned)
		return;

	names.clear();
	custom = source->customFonts();

	for (auto& family : source->systemFamilies()) {
		auto const name = trim(family);
		if (!name.empty())
			addUnique(names, name);
	}
	for (auto& font : custom)
		addUnique(names, font.name);

	auto const hasArial = std::any_of(names.begin(), names.end(), [](std::string const& n) {
		return toLower(n) == "arial";
	});
	if (hasArial)
		for (auto alias : aliasNames)
			addUnique(names, alias);

	std::sort(names.begin(), names.end());
	scanned = true;

	m_log->log(Info, format("Available fonts: %s (system + %s custom)", names.size(), custom.size()).c_str());
}

std::vector<std::string> FontCatalog::availableFontNames() {
	std::unique_lock<std::mutex> lock(mutex);
	scanIfNeeded();
	return names;
}

bool FontCatalog::contains(std::string const& name) {
	std::unique_lock<std::mutex> lock(mutex);
	scanIfNeeded();
	auto const lower = toLower(name);
	for (auto& n : names)
		if (toLower(n) == lower)
			return true;
	return false;
}

std::string FontCatalog::resolveAssFamily(std::string const& name) {
	{
		std::unique_lock<std::mutex> lock(mutex);
		scanIfNeeded();
		auto const lower = toLower(name);
		for (auto& font : custom) {
			if (toLower(font.name) != lower || isAlias(font.name))
				continue;
			auto const family = firstFamily(font.family);
			if (!family.empty())
				return family;
		}
	}

	auto const family = firstFamily(name);
	return family.empty() ? name : family;
}

void FontCatalog::require(std::string const& name) {
	if (contains(name))
		return;
	m_log->log(Warning, format("Font '%s' not found.", name).c_str());
	throw FontUnavailableError(name, availableFontNames());
}

void FontCatalog::invalidate() {
	std::unique_lock<std::mutex> lock(mutex);
	scanned = false;
}

}
