#undef NDEBUG
#include <cassert>

#include "logging.hpp"

int main() {
	// defaults: errors and warnings only
	assert(logging::channel(logging::Cerror));
	assert(logging::channel(logging::Cwarning));
	assert(!logging::channel(logging::Cinfo));
	assert(!logging::channel(logging::Cverbose));

	assert(logging::set_channels("+v-ew"));
	assert(logging::channel(logging::Cverbose));
	assert(!logging::channel(logging::Cerror));
	assert(!logging::channel(logging::Cwarning));

	assert(logging::set_channels("ei"));
	assert(logging::channel(logging::Cerror));
	assert(logging::channel(logging::Cinfo));

	assert(!logging::set_channels("+x"));

	// only messages on enabled channels count
	uint64_t before = logging::count();
	LOGVER("printed %d", 1);
	logging::set_channel(logging::Cverbose, false);
	LOGVER("not printed %d", 2);
	{
		LOGBLK
		LOGERR("printed %s", "too");
	}
	LOGALWAYS("always");
	assert(logging::count() == before + 3);

	return 0;
}
