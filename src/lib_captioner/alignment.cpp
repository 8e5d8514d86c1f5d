#include "alignment.hpp"
#include "lib_utils/tools.hpp"

namespace Captioner {

namespace {
int horizontalCode(std::string const& alignment) {
	if (alignment == "left")
		return 1;
	if (alignment == "right")
		return 3;
	return 2;
}

bool contains(std::string const& s, const char* what) {
	return s.find(what) != std::string::npos;
}
}

Placement determineAlignmentCode(std::string const& position, std::string const& alignment,
    double const* x, double const* y, Resolution const& video) {
	auto const align = toLower(alignment);
	Placement r;

	if (x && y) {
		r.anchor = 4 + (horizontalCode(align) - 1);
		r.x = (int)*x;
		r.y = (int)*y;
		return r;
	}

	auto const pos = toLower(position);
	double const width = video.width;
	double const height = video.height;

	int verticalBase;
	double verticalCenter;
	if (contains(pos, "top")) {
		verticalBase = 7;
		verticalCenter = height / 6;
	} else if (contains(pos, "middle")) {
		verticalBase = 4;
		verticalCenter = height / 2;
	} else {
		verticalBase = 1;
		verticalCenter = (5 * height) / 6;
	}

	double leftBoundary, rightBoundary, centerLine;
	if (contains(pos, "left")) {
		leftBoundary = 0;
		rightBoundary = width / 3;
		centerLine = width / 6;
	} else if (contains(pos, "right")) {
		leftBoundary = (2 * width) / 3;
		rightBoundary = width;
		centerLine = (5 * width) / 6;
	} else {
		leftBoundary = width / 3;
		rightBoundary = (2 * width) / 3;
		centerLine = width / 2;
	}

	auto const horiz = horizontalCode(align);
	double finalX;
	switch (horiz) {
	case 1: finalX = leftBoundary; break;
	case 3: finalX = rightBoundary; break;
	default: finalX = centerLine; break;
	}

	r.anchor = verticalBase + (horiz - 1);
	r.x = (int)finalX;
	r.y = (int)verticalCenter;
	return r;
}

std::string positionTag(Placement const& placement) {
	return "{\\an" + std::to_string(placement.anchor) + "\\pos(" + std::to_string(placement.x) + "," + std::to_string(placement.y) + ")}";
}

}
