#undef NDEBUG
#include <cassert>
#include <stdint.h>
#include <vector>

#include "swatchio_image.hpp"
#include "kmeans.hpp"
#include "palette.hpp"
#include "logging.hpp"

using namespace Swatch;

static std::vector<uint8_t> solid(int width, int height, uint8_t r, uint8_t g, uint8_t b) {
	std::vector<uint8_t> px((size_t)width * height * 4);
	for(size_t i = 0; i < px.size(); i += 4) {
		px[i + 0] = r;
		px[i + 1] = g;
		px[i + 2] = b;
		px[i + 3] = 0xFF;
	}
	return px;
}

int main() {
	logging::set_channel(logging::Cerror, false);

	// bad input
	{
		Image image;
		assert(!image.load("this/file/does/not/exist.png"));
		assert(image.empty());

		const uint8_t garbage[] = { 0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01 };
		assert(!image.load_from_memory(garbage, sizeof(garbage)));
		assert(!image.load_from_memory(nullptr, 0));
		assert(!image.assign(nullptr, 4, 4));

		std::vector<uint8_t> px = solid(2, 2, 1, 2, 3);
		assert(!image.assign(px.data(), 0, 2));
		assert(!image.downsample(128));
	}

	// longer side ends up at the target
	{
		std::vector<uint8_t> px = solid(300, 200, 255, 0, 0);
		Image image;
		assert(image.assign(px.data(), 300, 200));
		assert(image.width() == 300 && image.height() == 200);
		assert(image.pixels().size() == px.size());

		assert(image.downsample(0));
		assert(image.width() == 300);

		assert(image.downsample(128));
		assert(image.width() == 128 && image.height() == 85);
		assert(image.pixels().size() == (size_t)128 * 85 * 4);

		// a solid image stays a single cluster covering every pixel
		RandomSourceMt random(99);
		auto colors = kmeans(image.pixels(), random, 8);
		assert(colors.size() == 1);
		assert(colors[0].population == (size_t)128 * 85);

		Palette palette;
		assert(classify(colors, palette));
		assert(palette.vibrant() == palette.dominant());
	}

	// tall and tiny images
	{
		std::vector<uint8_t> px = solid(10, 40, 9, 9, 9);
		Image image;
		assert(image.assign(px.data(), 10, 40));
		assert(image.downsample(8));
		assert(image.width() == 2 && image.height() == 8);

		assert(image.downsample(1));
		assert(image.width() == 1 && image.height() == 1);
	}

	return 0;
}
