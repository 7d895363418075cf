#include "logging.hpp"
#include <string.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <array>
#include <mutex>

static const int MAX_MSG_LENGTH = 2048;

static const int INDENT_STEP_SIZE = 2;

namespace logging{

	static std::mutex log_mutex;

	static uint64_t messages_sent = 0;

	static uint32_t indent_level = 0;

	static uint32_t prev_count = 0;
	static char prev_msg[MAX_MSG_LENGTH] = {0};
	static char this_msg[MAX_MSG_LENGTH] = {0};

	//errors and warnings are on until someone says otherwise
	static std::array<bool, (size_t)LEVEL::LEVEL_ITEM_COUNT> channels = { true, true, false, false };

	uint64_t count() {
		std::lock_guard<std::mutex> lock(log_mutex);
		return messages_sent;
	}

	void indent(){
		std::lock_guard<std::mutex> lock(log_mutex);
		indent_level += INDENT_STEP_SIZE;
	}

	void undent(){
		if(INDENT_STEP_SIZE == 0){ return; }
		std::lock_guard<std::mutex> lock(log_mutex);
		if(indent_level >= INDENT_STEP_SIZE) { indent_level -= INDENT_STEP_SIZE; }
	}

	void set_channel(LEVEL lvl, bool state){
		std::lock_guard<std::mutex> lock(log_mutex);
		channels[(size_t)lvl] = state;
	}

	bool channel(LEVEL lvl){
		std::lock_guard<std::mutex> lock(log_mutex);
		return channels[(size_t)lvl];
	}

	bool set_channels(const char* flags){
		bool mode = true;
		for(size_t i = 0; flags[i] != '\0'; i++) {
			switch(flags[i]) {
				case '-': mode = false; break;
				case '+': mode = true; break;
				case 'v': set_channel(Cverbose, mode); break;
				case 'e': set_channel(Cerror, mode); break;
				case 'w': set_channel(Cwarning, mode); break;
				case 'i': set_channel(Cinfo, mode); break;
				default: return false;
			}
		}
		return true;
	}

	//caller holds log_mutex
	static void log_basic_valist(const char* str, va_list all_varg){
		messages_sent++;

		vsnprintf(this_msg, MAX_MSG_LENGTH, str, all_varg);

		if (strcmp(this_msg, prev_msg)) // mismatch
		{
			strncpy(prev_msg, this_msg, MAX_MSG_LENGTH - 1);
			fprintf(stderr, prev_count ? "\n" : "");
			fprintf(stderr, "%*s%s\r", indent_level, "", this_msg);
			prev_count = 1;
		}
		else { // match; repeated message
			fprintf(stderr, "%*s%s   [x%u]\r", indent_level, "", this_msg, ++prev_count);
		}
		fflush(stderr);
	}

	void log_basic(const char* str, ...){
		std::lock_guard<std::mutex> lock(log_mutex);
		va_list all_varg;
		va_start(all_varg, str);
		log_basic_valist(str, all_varg);
		va_end(all_varg);
	}

	void log_advanced(LEVEL lvl, const char* str, ...){
		std::lock_guard<std::mutex> lock(log_mutex);
		if(channels[(size_t)lvl] == true){
			va_list all_varg;
			va_start(all_varg, str);
			log_basic_valist(str, all_varg);
			va_end(all_varg);
		}
	}
}
