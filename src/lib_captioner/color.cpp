#include "color.hpp"

namespace Captioner {

const char* const AssFallbackColor = "&H00FFFFFF";

namespace {
bool isHexDigit(char c) {
	return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

char toUpperHex(char c) {
	return (c >= 'a' && c <= 'f') ? c - 'a' + 'A' : c;
}
}

std::string rgbToAssColor(std::string const& rgb) {
	auto hex = rgb;
	while (!hex.empty() && hex[0] == '#')
		hex.erase(0, 1);

	if (hex.size() != 6)
		return AssFallbackColor;

	for (auto c : hex)
		if (!isHexDigit(c))
			return AssFallbackColor;

	std::string r = "&H00";
	r += toUpperHex(hex[4]);
	r += toUpperHex(hex[5]);
	r += toUpperHex(hex[2]);
	r += toUpperHex(hex[3]);
	r += toUpperHex(hex[0]);
	r += toUpperHex(hex[1]);
	return r;
}

}
