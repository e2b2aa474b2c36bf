#pragma once

#include <format>
#include <string>
#include <utility>

extern "C" {
	#include <libavutil/log.h>
}

namespace encspec::log {
	// Formats and forwards a message to FFmpeg's logger.
	//
	// The message is only formatted if the logger would print it at `level` (one of the `AV_LOG_*` levels).
	template<typename... Args>
	inline void write(int level, std::format_string<Args...> fmt, Args&&... args) {
		if(av_log_get_level() < level) {
			return;
		}

		const std::string msg = std::format(fmt, std::forward<Args>(args)...);
		av_log(nullptr, level, "%s\n", msg.c_str());
	}

	template<typename... Args>
	inline void debug(std::format_string<Args...> fmt, Args&&... args) {
		write(AV_LOG_DEBUG, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args>
	inline void verbose(std::format_string<Args...> fmt, Args&&... args) {
		write(AV_LOG_VERBOSE, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args>
	inline void warning(std::format_string<Args...> fmt, Args&&... args) {
		write(AV_LOG_WARNING, fmt, std::forward<Args>(args)...);
	}
}
