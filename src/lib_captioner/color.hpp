#pragma once

#include <string>

namespace Captioner {

// "#RRGGBB" or "RRGGBB" to the ASS "&H00BBGGRR" encoding (opaque).
// Malformed colors give opaque white, they are never an error.
std::string rgbToAssColor(std::string const& rgb);

extern const char* const AssFallbackColor;

}
