#pragma once

#include "transcription.hpp" // Resolution
#include <string>

namespace Captioner {

// ASS \an code (numpad layout: 1-3 bottom row, 4-6 middle row, 7-9 top row)
// and the pixel position it is pinned to.
struct Placement {
	int anchor = 5;
	int x = 0;
	int y = 0;
};

// 'position' is one of {top,middle,bottom}_{left,center,right}, 'alignment' one of left/center/right.
// When both x and y are given (non-null), 'position' is ignored and the text is anchored
// on the middle row at (x, y). Otherwise the video is split into a 3x3 grid: the cell is
// selected by 'position' and 'alignment' selects the left edge, the midline or the right
// edge of the cell.
Placement determineAlignmentCode(std::string const& position, std::string const& alignment,
    double const* x, double const* y, Resolution const& video);

// "{\anN\pos(X,Y)}"
std::string positionTag(Placement const& placement);

}
