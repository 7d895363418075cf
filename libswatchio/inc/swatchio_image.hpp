#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace Swatch {
	//decoded RGBA8 bitmap. everything that comes out of here has 4 channels,
	//no matter what the source file had
	class Image {
	public:
		Image() {}
		~Image() {}

		bool load(const char* const path);
		bool load_from_memory(const uint8_t* data, size_t data_size);
		bool assign(const uint8_t* rgba, int width, int height); //copies

		//scales the image so the longer side is target_size pixels. target_size <= 0 leaves it alone
		bool downsample(int target_size);

		int width() const { return _width; }
		int height() const { return _height; }
		bool empty() const { return _pixels.empty(); }
		const std::vector<uint8_t>& pixels() const { return _pixels; }

	private:
		bool take_stb(uint8_t* data, int width, int height);

		std::vector<uint8_t> _pixels;
		int _width = 0;
		int _height = 0;
	};
}
