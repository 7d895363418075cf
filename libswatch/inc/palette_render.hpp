#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "palette.hpp"

namespace Swatch {
	std::string palette_report(const Palette& palette);

	//RGBA8 swatch sheet. top half: one equal column per role (transparent if the role is empty),
	//bottom half: every color with a width proportional to its population
	bool palette_render(const Palette& palette, int width, int height, std::vector<uint8_t>& out_rgba);

	bool palette_write_png(const Palette& palette, const char* const path, int width = 512, int height = 128);
}
