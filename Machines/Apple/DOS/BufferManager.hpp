//
//  BufferManager.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "Session.hpp"
#include "Storage/KeyValue/Store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace Apple::DOS {

/*!
	Implements the DOS text-file operations against a Session's buffers, loading from and writing
	back to a durable Store.

	Every failure is reported by throwing Fault; no operation modifies any state before it fails.
*/
class BufferManager {
public:
	/// @c source, if supplied, provides initial content for files that @c store doesn't have.
	BufferManager(Session &, Storage::KeyValue::Store &, Storage::KeyValue::ContentSource *source = nullptr);

	//
	// Commands.
	//

	/// OPEN: opens @c name, closing it first if it is already open. A @c record_length of 0 selects sequential access.
	void open(const std::string &name, std::size_t record_length);

	/// APPEND: opens @c name and places the file pointer at its end.
	void append(const std::string &name, std::size_t record_length);

	/// CLOSE: writes @c name back to the store and discards its buffer. Does nothing if @c name isn't open.
	void close(const std::string &name);

	/// CLOSE with no file name.
	void close_all();

	/// POSITION: advances @c name by @c records records, opening it if necessary.
	void position(const std::string &name, std::size_t records);

	/// READ: redirects terminal input to come from @c name, starting at @c record and @c byte.
	void read(const std::string &name, std::size_t record, std::size_t byte);

	/// WRITE: redirects terminal output to go to @c name, starting at @c record and @c byte.
	void write(const std::string &name, std::size_t record, std::size_t byte);

	/// DELETE.
	void unlink(const std::string &name);

	/// RENAME.
	void rename(const std::string &from, const std::string &to);

	//
	// Character I/O against the active buffer.
	//

	/// Reads the next character from the active buffer.
	char read_character();

	/// Reads characters up to the next carriage return, line feed or NUL, consuming but not returning the terminator.
	std::string read_line();

	/// Places @c c at the active buffer's file pointer, extending the file with NULs if necessary, and advances.
	void write_character(char c);

private:
	Session &session_;
	Storage::KeyValue::Store &store_;
	Storage::KeyValue::ContentSource *const source_;

	std::optional<std::string> load(const std::string &name);
	std::optional<std::string> current_content(const std::string &name);
	void flush(const Buffer &);
	Buffer *find(const std::string &name);

	/// Closes any existing buffer for @c name, then opens a new one with @c content.
	Buffer &emplace(const std::string &name, std::size_t record_length, std::optional<std::string> &&content);
	Buffer &active_buffer(Mode);
};

}
