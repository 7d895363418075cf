#pragma once

#include <stdint.h>
#include <stddef.h>
#include <random>

namespace Swatch {
	//hands out indices for centroid seeding. one instance per quantize call
	//(or per thread), nothing in here is shared
	class RandomSource {
	public:
		virtual ~RandomSource() {}

		//uniform in [0, count). count is never 0
		virtual size_t pick(size_t count) = 0;
	};

	class RandomSourceMt : public RandomSource {
	public:
		//seed 0 means "ask std::random_device"
		explicit RandomSourceMt(uint64_t seed = 0) : _rng(seed ? seed : std::random_device{}()) {}

		size_t pick(size_t count) {
			std::uniform_int_distribution<size_t> dist(0, count - 1);
			return dist(_rng);
		}

	private:
		std::mt19937_64 _rng;
	};
}
