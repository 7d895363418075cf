#include "swatchio_image.hpp"

#include <algorithm>
#include <cmath>
#include <limits.h>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize.h"

#include "logging.hpp"

static const int CHANNELS = 4;

bool Swatch::Image::take_stb(uint8_t* data, int width, int height) {
	if(!data) {
		LOGERR("stb_image couldn't decode the image: %s", stbi_failure_reason());
		return false;
	}
	_pixels.assign(data, data + ((size_t)width * height * CHANNELS));
	_width = width;
	_height = height;
	stbi_image_free(data);
	return true;
}

bool Swatch::Image::load(const char* const path) {
	int width = 0, height = 0, channels = CHANNELS;
	uint8_t* data = stbi_load(path, &width, &height, &channels, CHANNELS);
	if(!data) {
		LOGERR("couldn't load %s: %s", path, stbi_failure_reason());
		return false;
	}
	LOGVER("loaded %s (%dx%d, %d channels in file)", path, width, height, channels);
	return take_stb(data, width, height);
}

bool Swatch::Image::load_from_memory(const uint8_t* data, size_t data_size) {
	if(!data || data_size == 0 || data_size > INT_MAX) {
		LOGERR("got %zu bytes of image data, that can't be decoded", data_size);
		return false;
	}
	int width = 0, height = 0, channels = CHANNELS;
	uint8_t* decoded = stbi_load_from_memory(data, (int)data_size, &width, &height, &channels, CHANNELS);
	return take_stb(decoded, width, height);
}

bool Swatch::Image::assign(const uint8_t* rgba, int width, int height) {
	if(!rgba || width <= 0 || height <= 0) {
		LOGERR("invalid bitmap (%dx%d)", width, height);
		return false;
	}
	_pixels.assign(rgba, rgba + ((size_t)width * height * CHANNELS));
	_width = width;
	_height = height;
	return true;
}

bool Swatch::Image::downsample(int target_size) {
	if(target_size <= 0) { return true; }
	if(empty()) {
		LOGERR("nothing loaded to downsample");
		return false;
	}

	const double scale = std::min((double)target_size / _width, (double)target_size / _height);
	const int out_width = std::max(1, (int)std::lround(_width * scale));
	const int out_height = std::max(1, (int)std::lround(_height * scale));
	if(out_width == _width && out_height == _height) { return true; }

	std::vector<uint8_t> out((size_t)out_width * out_height * CHANNELS);
	if(!stbir_resize_uint8_srgb(_pixels.data(), _width, _height, 0, out.data(), out_width, out_height, 0, CHANNELS, 3, 0)) {
		LOGERR("couldn't resize %dx%d to %dx%d", _width, _height, out_width, out_height);
		return false;
	}
	LOGVER("resized %dx%d to %dx%d", _width, _height, out_width, out_height);

	_pixels.swap(out);
	_width = out_width;
	_height = out_height;
	return true;
}
