#pragma once

#include <stddef.h>
#include <utility>
#include <vector>

#include "random_source.hpp"

//replays a fixed list of indices, wrapping around when it runs out
class RandomSourceSequence : public Swatch::RandomSource {
public:
	explicit RandomSourceSequence(std::vector<size_t> picks) : _picks(std::move(picks)) {}

	size_t pick(size_t count) {
		size_t value = _picks.empty() ? 0 : _picks[_next++ % _picks.size()];
		return value % count;
	}

private:
	std::vector<size_t> _picks;
	size_t _next = 0;
};
