#undef NDEBUG
#include <cassert>
#include <cmath>
#include <string>

#include "color_convert.hpp"

using namespace Swatch;

static bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

static bool looks_like_hex(const std::string& s) {
	if(s.size() != 7 || s[0] != '#') { return false; }
	for(size_t i = 1; i < s.size(); i++) {
		char c = s[i];
		if(!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) { return false; }
	}
	return true;
}

int main() {
	// hex
	{
		assert(rgb_to_hex({255, 0, 0}) == "#ff0000");
		assert(rgb_to_hex({0, 0, 0}) == "#000000");
		assert(rgb_to_hex({171, 205, 239}) == "#abcdef");
		assert(rgb_to_hex({15.4, 16.5, 254.6}) == "#0f11ff");
		assert(rgb_to_hex({300, -5, 128}) == "#ff0080");

		for(double r = -10; r <= 270; r += 7.3) {
			for(double g = 0; g <= 255; g += 51) {
				assert(looks_like_hex(rgb_to_hex({r, g, 255 - g})));
			}
		}
	}

	// hsl, primaries and secondaries
	{
		HSL red = rgb_to_hsl({255, 0, 0});
		assert(near(red.h, 0) && near(red.s, 1) && near(red.l, 0.5));

		HSL green = rgb_to_hsl({0, 255, 0});
		assert(near(green.h, 120) && near(green.s, 1) && near(green.l, 0.5));

		HSL blue = rgb_to_hsl({0, 0, 255});
		assert(near(blue.h, 240) && near(blue.s, 1));

		// red and blue share the max, red's formula wins
		HSL magenta = rgb_to_hsl({255, 0, 255});
		assert(near(magenta.h, 300));

		// red and green share the max
		HSL yellow = rgb_to_hsl({255, 255, 0});
		assert(near(yellow.h, 60));

		// green and blue share the max
		HSL cyan = rgb_to_hsl({0, 255, 255});
		assert(near(cyan.h, 180));
	}

	// hsl, achromatic and the l > 0.5 branch
	{
		HSL white = rgb_to_hsl({255, 255, 255});
		assert(near(white.h, 0) && near(white.s, 0) && near(white.l, 1));

		HSL grey = rgb_to_hsl({128, 128, 128});
		assert(near(grey.s, 0) && near(grey.l, 128 / 255.0));

		HSL pink = rgb_to_hsl({255, 128, 128});
		assert(pink.l > 0.5);
		assert(near(pink.s, 1, 1e-9));
		assert(near(pink.h, 0));

		HSL navy = rgb_to_hsl({20, 40, 120});
		assert(navy.l < 0.4 && navy.s > 0.7);
		assert(navy.h > 225 && navy.h < 230);
	}

	// luminance
	{
		assert(near(luminance({0, 0, 0}), 0));
		assert(near(luminance({255, 255, 255}), 1, 1e-9));
		assert(near(luminance({255, 0, 0}), 0.2126));
		assert(near(luminance({0, 255, 0}), 0.7152));
		assert(near(luminance({0, 0, 255}), 0.0722));
		// linear segment
		assert(near(luminance({10, 10, 10}), (10 / 255.0) / 12.92));

		for(int r = 0; r <= 255; r += 15) {
			for(int g = 0; g <= 255; g += 15) {
				for(int b = 0; b <= 255; b += 15) {
					double lum = luminance({(double)r, (double)g, (double)b});
					assert(lum >= 0.0 && lum <= 1.0 + 1e-12);
				}
			}
		}
	}

	return 0;
}
