#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "color_convert.hpp"
#include "random_source.hpp"

namespace Swatch {
	struct PaletteColor {
		RGB rgb; //rounded
		HSL hsl; //from the unrounded centroid
		std::string hex;
		size_t population = 0; //pixels assigned to this cluster
		double score = 0;
		bool is_vibrant = false;
		bool is_dark = false;
		bool is_light = false;
	};

	static const int KMEANS_DEFAULT_K = 8;
	static const int KMEANS_DEFAULT_ROUNDS = 5;
	static const uint8_t KMEANS_ALPHA_CUTOFF = 128; //pixels below this don't exist as far as clustering cares

	//runs exactly `rounds` assign/update passes over an RGBA8 buffer and returns the non-empty clusters,
	//most populated first. empty clusters keep their centroid and are dropped at the end.
	//returns nothing if there are no opaque pixels or k_count <= 0
	std::vector<PaletteColor> kmeans(const uint8_t* rgba, size_t length, RandomSource& random, int k_count = KMEANS_DEFAULT_K, int rounds = KMEANS_DEFAULT_ROUNDS);
	std::vector<PaletteColor> kmeans(const std::vector<uint8_t>& rgba, RandomSource& random, int k_count = KMEANS_DEFAULT_K, int rounds = KMEANS_DEFAULT_ROUNDS);

	//seeds from std::random_device
	std::vector<PaletteColor> kmeans(const std::vector<uint8_t>& rgba, int k_count = KMEANS_DEFAULT_K, int rounds = KMEANS_DEFAULT_ROUNDS);

	PaletteColor make_palette_color(const RGB& centroid, size_t population);
}
