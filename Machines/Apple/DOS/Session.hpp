//
//  Session.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace Apple::DOS {

/// The in-memory form of an open text file.
struct Buffer {
	Buffer(const std::string &name, std::optional<std::string> &&content, std::size_t record_length) :
		name(name), content(std::move(content)), record_length(record_length ? record_length : 1) {}

	const std::string name;

	/// The file's bytes; @c std::nullopt if the file does not yet exist.
	std::optional<std::string> content;

	/// Stride used to convert record numbers to byte offsets; 1 indicates sequential access.
	const std::size_t record_length;

	/// Advisory only. @c file_pointer is authoritative.
	std::size_t record_number = 0;
	std::size_t file_pointer = 0;
};

enum class Mode {
	None, Read, Write
};

/// Bits of Session::monitor, as set by MON and cleared by NOMON.
enum Monitor: int {
	Input = 1 << 0,
	Commands = 1 << 1,
	Output = 1 << 2,
};

/*!
	All mutable state for one DOS instance: open buffers, the buffer (if any) to which
	terminal I/O is currently redirected, tracing and the command-line accumulator.
*/
struct Session {
	// Open buffers, by name. Buffers don't move once inserted, so @c active may point into this.
	std::unordered_map<std::string, Buffer> buffers;
	Buffer *active = nullptr;
	Mode mode = Mode::None;

	int monitor = 0;

	bool command_mode = false;
	std::string command;

	/// Ends any READ or WRITE without closing the buffer.
	void deactivate() {
		active = nullptr;
		mode = Mode::None;
	}

	/// Discards all buffers without writing them back and returns to the initial state.
	void reset() {
		buffers.clear();
		deactivate();
		monitor = 0;
		command_mode = false;
		command.clear();
	}
};

}
