#pragma once

#include <string>

namespace Swatch {
	//channels nominally 0-255, fractional while they're still centroids
	struct RGB {
		double r;
		double g;
		double b;
	};

	struct HSL {
		double h; //degrees, [0, 360)
		double s; //[0, 1]
		double l; //[0, 1]
	};

	//"#rrggbb", lowercase. channels get rounded and clamped to 0-255
	std::string rgb_to_hex(const RGB& rgb);

	HSL rgb_to_hsl(const RGB& rgb);

	//relative luminance (sRGB linearized, Rec. 709 weights), [0, 1]
	double luminance(const RGB& rgb);
}
