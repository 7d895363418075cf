#include "kmeans.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "logging.hpp"

namespace {

inline double distance_sq(const Swatch::RGB& c1, const Swatch::RGB& c2) {
	return (c1.r - c2.r) * (c1.r - c2.r)
		+ (c1.g - c2.g) * (c1.g - c2.g)
		+ (c1.b - c2.b) * (c1.b - c2.b);
}

//nearest centroid per opaque pixel, accumulated straight into sums/counts
void assign_cluster_centres(const uint8_t* rgba, size_t pixel_count, const std::vector<Swatch::RGB>& points, std::vector<double>& sums, std::vector<size_t>& counts) {
	std::fill(sums.begin(), sums.end(), 0.0);
	std::fill(counts.begin(), counts.end(), 0);

	for(size_t i = 0; i < pixel_count; i++) {
		const uint8_t* px = rgba + (i * 4);
		if(px[3] < Swatch::KMEANS_ALPHA_CUTOFF) { continue; }

		const Swatch::RGB cf = { (double)px[0], (double)px[1], (double)px[2] };
		double min_dist = std::numeric_limits<double>::infinity();
		size_t closest = 0;
		for(size_t k = 0; k < points.size(); k++) {
			double distance = distance_sq(points[k], cf);
			if(distance < min_dist) {
				min_dist = distance;
				closest = k;
			}
		}

		sums[(closest * 3) + 0] += cf.r;
		sums[(closest * 3) + 1] += cf.g;
		sums[(closest * 3) + 2] += cf.b;
		counts[closest]++;
	}
}

//returns amount of points that have a group attached. points without one stay where they are
size_t compute_points(const std::vector<double>& sums, const std::vector<size_t>& counts, std::vector<Swatch::RGB>& points) {
	size_t k_matched = 0;
	for(size_t k = 0; k < points.size(); k++) {
		if(!counts[k]) { continue; }
		k_matched++;
		points[k].r = sums[(k * 3) + 0] / (double)counts[k];
		points[k].g = sums[(k * 3) + 1] / (double)counts[k];
		points[k].b = sums[(k * 3) + 2] / (double)counts[k];
	}
	return k_matched;
}

}

Swatch::PaletteColor Swatch::make_palette_color(const RGB& centroid, size_t population) {
	PaletteColor col;
	col.rgb = { std::round(centroid.r), std::round(centroid.g), std::round(centroid.b) };
	col.hex = rgb_to_hex(col.rgb);
	//hsl and the flags use the unrounded centroid, only rgb/hex are rounded
	col.hsl = rgb_to_hsl(centroid);
	col.population = population;
	col.score = (double)population;
	col.is_vibrant = col.hsl.s > 0.5 && col.hsl.l > 0.3 && col.hsl.l < 0.8;
	col.is_dark = col.hsl.l < 0.4;
	col.is_light = col.hsl.l > 0.7;
	return col;
}

std::vector<Swatch::PaletteColor> Swatch::kmeans(const uint8_t* rgba, size_t length, RandomSource& random, int k_count, int rounds) {
	LOGBLK

	std::vector<PaletteColor> out_palette;
	const size_t pixel_count = length / 4;
	if(length % 4) {
		LOGWAR("buffer length %zu isn't a multiple of 4, ignoring the last %zu bytes", length, length % 4);
	}
	if(k_count <= 0) {
		LOGVER("asked for %d clusters, nothing to do", k_count);
		return out_palette;
	}
	if(!rgba || pixel_count == 0) {
		LOGVER("no pixels to cluster");
		return out_palette;
	}
	if(rounds < 1) {
		LOGWAR("%d rounds requested, running 1", rounds);
		rounds = 1;
	}

	//starting points are random pixels from the image. duplicates are fine
	std::vector<RGB> points(k_count);
	for(int i = 0; i < k_count; i++) {
		const uint8_t* px = rgba + (random.pick(pixel_count) * 4);
		points[i] = { (double)px[0], (double)px[1], (double)px[2] };
	}

	std::vector<double> sums((size_t)k_count * 3);
	std::vector<size_t> counts(k_count);

	for(int i = 0; i < rounds; i++) {
		assign_cluster_centres(rgba, pixel_count, points, sums, counts);
		size_t k_matched = compute_points(sums, counts, points);
		LOGVER("round %d: %zu/%d points had pixels in their group", i + 1, k_matched, k_count);
	}

	for(int k = 0; k < k_count; k++) {
		if(counts[k] == 0) { continue; }
		out_palette.push_back(make_palette_color(points[k], counts[k]));
	}

	std::stable_sort(out_palette.begin(), out_palette.end(), [](const PaletteColor& a, const PaletteColor& b) {
		return a.population > b.population;
	});

	LOGVER("%zu clusters out of %d survived", out_palette.size(), k_count);
	return out_palette;
}

std::vector<Swatch::PaletteColor> Swatch::kmeans(const std::vector<uint8_t>& rgba, RandomSource& random, int k_count, int rounds) {
	return kmeans(rgba.data(), rgba.size(), random, k_count, rounds);
}

std::vector<Swatch::PaletteColor> Swatch::kmeans(const std::vector<uint8_t>& rgba, int k_count, int rounds) {
	RandomSourceMt random;
	return kmeans(rgba.data(), rgba.size(), random, k_count, rounds);
}
