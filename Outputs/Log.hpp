//
//  Log.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 18/06/2018.
//  Copyright © 2018 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>

namespace Log {
// C files rather than C++ streams; lines are printf-formatted.

enum class Source {
	DOSBuffers,
	DOSChannel,
	DOSCommands,
	KeyValueStore,
	TerminalHost,
};

enum class EnabledLevel {
	None,				// No logged statements are presented.
	Errors,				// The error stream is presented, but not the info stream.
	ErrorsAndInfo,		// All streams are presented.
};

constexpr EnabledLevel enabled_level(const Source source) {
#ifdef NDEBUG
	return EnabledLevel::None;
#endif

	// Allow for compile-time source-level enabling and disabling of different sources.
	switch(source) {
		default:
			return EnabledLevel::ErrorsAndInfo;

		// Per-character traffic is far too noisy for general use.
		case Source::DOSChannel:
			return EnabledLevel::Errors;
	}
}

constexpr const char *prefix(const Source source) {
	switch(source) {
		case Source::DOSBuffers:		return "DOS buffers";
		case Source::DOSChannel:		return "DOS channel";
		case Source::DOSCommands:		return "DOS";
		case Source::KeyValueStore:		return "Store";
		case Source::TerminalHost:		return "Terminal";
	}

	return nullptr;
}

template <Source source, bool enabled>
struct LogLine;

struct RepeatAccumulator {
	std::string last;
	Source source;

	size_t count = 0;
	FILE *stream;
};

struct AccumulatingLog {
	inline static thread_local RepeatAccumulator accumulator_;
};

template <Source source>
struct LogLine<source, true>: private AccumulatingLog {
public:
	explicit LogLine(FILE *const stream) noexcept :
		stream_(stream) {}

	~LogLine() {
		if(output_ == accumulator_.last && source == accumulator_.source && stream_ == accumulator_.stream) {
			++accumulator_.count;
			return;
		}

		if(!accumulator_.last.empty()) {
			const char *const unadorned_prefix = prefix(accumulator_.source);
			std::string prefix;
			if(unadorned_prefix) {
				prefix = "[";
				prefix += unadorned_prefix;
				prefix += "] ";
			}

			if(accumulator_.count > 1) {
				fprintf(
					accumulator_.stream,
					"%s%s [* %zu]\n",
						prefix.c_str(),
						accumulator_.last.c_str(),
						accumulator_.count
				);
			} else {
				fprintf(
					accumulator_.stream,
					"%s%s\n",
						prefix.c_str(),
						accumulator_.last.c_str()
				);
			}
		}

		accumulator_.count = 1;
		accumulator_.last = output_;
		accumulator_.source = source;
		accumulator_.stream = stream_;
	}

	template <size_t size, typename... Args>
	auto &append(const char (&format)[size], Args... args) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat"
		const auto append_size = std::snprintf(nullptr, 0, format, args...);
		const auto end = output_.size();
		output_.resize(output_.size() + size_t(append_size) + 1);
		std::snprintf(output_.data() + end, size_t(append_size) + 1, format, args...);
		output_.pop_back();
#pragma GCC diagnostic pop
		return *this;
	}

	template <size_t size, typename... Args>
	auto &append_if(const bool condition, const char (&format)[size], Args... args) {
		if(!condition) return *this;
		return append(format, args...);
	}

private:
	FILE *stream_;
	std::string output_;
};

template <Source source>
struct LogLine<source, false> {
	explicit LogLine(FILE *) noexcept {}

	template <size_t size, typename... Args>
	auto &append(const char (&)[size], Args...) { return *this; }

	template <size_t size, typename... Args>
	auto &append_if(bool, const char (&)[size], Args...) { return *this; }
};

template <Source source>
class Logger {
public:
	static constexpr bool InfoEnabled = enabled_level(source) == EnabledLevel::ErrorsAndInfo;
	static constexpr bool ErrorsEnabled = enabled_level(source) >= EnabledLevel::Errors;

	// Both streams go to stderr; stdout carries terminal output.
	static auto info()	{	return LogLine<source, InfoEnabled>(stderr);	}
	static auto error()	{	return LogLine<source, ErrorsEnabled>(stderr);	}
};

}
