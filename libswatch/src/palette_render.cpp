#include "palette_render.hpp"

#include <stdio.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include "logging.hpp"

std::string Swatch::palette_report(const Palette& palette) {
	std::string out;
	char line[256];

	for(size_t r = 0; r < (size_t)Palette::Role::ROLE_ITEM_COUNT; r++) {
		const Palette::Role role = (Palette::Role)r;
		const PaletteColor* c = palette.role(role);
		snprintf(line, sizeof(line), "%-14s %s\n", Palette::role_name(role), c ? c->hex.c_str() : "-");
		out += line;
	}

	const size_t total = palette.total_population();
	snprintf(line, sizeof(line), "\n%zu colors, %zu pixels:\n", palette.all_colors.size(), total);
	out += line;

	for(const auto& c : palette.all_colors) {
		const double share = total ? (100.0 * c.population / total) : 0.0;
		snprintf(line, sizeof(line), "  %s  %8zu px  %5.1f%%  hsl(%.0f, %.0f%%, %.0f%%)  lum %.3f%s%s%s\n",
			c.hex.c_str(), c.population, share,
			c.hsl.h, c.hsl.s * 100, c.hsl.l * 100, luminance(c.rgb),
			c.is_vibrant ? "  vibrant" : "", c.is_dark ? "  dark" : "", c.is_light ? "  light" : "");
		out += line;
	}
	return out;
}

static void put_pixel(std::vector<uint8_t>& rgba, int width, int x, int y, const Swatch::PaletteColor* c) {
	uint8_t* px = &rgba[((size_t)y * width + x) * 4];
	if(!c) {
		px[0] = px[1] = px[2] = px[3] = 0;
		return;
	}
	px[0] = (uint8_t)c->rgb.r;
	px[1] = (uint8_t)c->rgb.g;
	px[2] = (uint8_t)c->rgb.b;
	px[3] = 0xFF;
}

bool Swatch::palette_render(const Palette& palette, int width, int height, std::vector<uint8_t>& out_rgba) {
	if(width <= 0 || height <= 0) {
		LOGERR("can't render a %dx%d swatch sheet", width, height);
		return false;
	}
	out_rgba.assign((size_t)width * height * 4, 0);

	const int split = height / 2;
	const size_t role_count = (size_t)Palette::Role::ROLE_ITEM_COUNT;
	for(int y = 0; y < split; y++) {
		for(int x = 0; x < width; x++) {
			size_t r = ((size_t)x * role_count) / width;
			put_pixel(out_rgba, width, x, y, palette.role((Palette::Role)r));
		}
	}

	//spectrum strip. the center of every column picks the color whose population range it falls into
	const size_t total = palette.total_population();
	if(total == 0) { return true; }
	std::vector<size_t> cumulative(palette.all_colors.size());
	size_t running = 0;
	for(size_t i = 0; i < palette.all_colors.size(); i++) {
		running += palette.all_colors[i].population;
		cumulative[i] = running;
	}

	for(int x = 0; x < width; x++) {
		size_t pos = ((2 * (size_t)x + 1) * total) / (2 * (size_t)width);
		size_t i = 0;
		while(i + 1 < cumulative.size() && cumulative[i] <= pos) { i++; }
		for(int y = split; y < height; y++) {
			put_pixel(out_rgba, width, x, y, &palette.all_colors[i]);
		}
	}
	return true;
}

bool Swatch::palette_write_png(const Palette& palette, const char* const path, int width, int height) {
	std::vector<uint8_t> rgba;
	if(!palette_render(palette, width, height, rgba)) { return false; }
	if(!stbi_write_png(path, width, height, 4, rgba.data(), width * 4)) {
		LOGERR("couldn't save %s", path);
		return false;
	}
	LOGVER("wrote %dx%d swatch sheet to %s", width, height, path);
	return true;
}
