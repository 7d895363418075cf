#include "color_convert.hpp"

#include <algorithm>
#include <cmath>
#include <stdio.h>

static int to_byte(double v) {
	long rounded = std::lround(v);
	if(rounded < 0) { return 0; }
	if(rounded > 255) { return 255; }
	return (int)rounded;
}

std::string Swatch::rgb_to_hex(const RGB& rgb) {
	char buf[8];
	snprintf(buf, sizeof(buf), "#%02x%02x%02x", to_byte(rgb.r), to_byte(rgb.g), to_byte(rgb.b));
	return std::string(buf);
}

Swatch::HSL Swatch::rgb_to_hsl(const RGB& rgb) {
	const double r = rgb.r / 255.0;
	const double g = rgb.g / 255.0;
	const double b = rgb.b / 255.0;

	const double max = std::max(r, std::max(g, b));
	const double min = std::min(r, std::min(g, b));
	const double l = (max + min) / 2;
	double h = 0, s = 0;

	if(max != min) {
		const double d = max - min;
		s = (l > 0.5) ? d / (2 - max - min) : d / (max + min);

		//red wins over green wins over blue when they share the max
		if(max == r) { h = (g - b) / d + ((g < b) ? 6 : 0); }
		else if(max == g) { h = (b - r) / d + 2; }
		else { h = (r - g) / d + 4; }
		h /= 6;
	}

	return { h * 360, s, l };
}

static double linearize(double v) {
	v /= 255.0;
	return (v <= 0.03928) ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
}

double Swatch::luminance(const RGB& rgb) {
	return linearize(rgb.r) * 0.2126 + linearize(rgb.g) * 0.7152 + linearize(rgb.b) * 0.0722;
}
