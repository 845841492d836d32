//
//  FileHolder.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 21/11/2016.
//  Copyright 2016 Thomas Harte. All rights reserved.
//

#pragma once

#include <sys/stat.h>
#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>

namespace Storage {

enum class FileMode {
	Read,
	Rewrite
};

class FileHolder final {
public:
	enum class Error {
		CantOpen = -1,
		CantWrite = -2,
	};

	~FileHolder();
	FileHolder(const FileHolder &) = delete;
	FileHolder &operator =(const FileHolder &) = delete;

	/*!
		Attempts to open the file indicated by @c file_name. @c mode nominates how the file should
		be opened. It can be one of:

			Read		opens this file for reading only.
			Rewrite		opens the file for rewriting; none of the original content is preserved; whatever
						the caller outputs will replace the existing file.

		@throws Error::CantOpen if the file cannot be opened.
	*/
	FileHolder(const std::string &file_name, FileMode mode);

	/*! Reads up to @c size bytes and returns them as a vector. */
	std::vector<uint8_t> read(std::size_t);

	/*!
		Writes @c size bytes from @c buffer.

		@throws Error::CantWrite if fewer than @c size bytes could be written.
	*/
	void write(const uint8_t *, std::size_t);

	/*!
		Flushes any queued content that has not yet been written to disk.

		@throws Error::CantWrite if the flush fails.
	*/
	void flush();

	/*!
		@returns the stat struct describing this file, as it was when opened.
	*/
	const struct stat &stats() const;

private:
	FILE *file_ = nullptr;
	struct stat file_stats_{};
};

/*!
	@returns The entire contents of @c file_name.
	@throws FileHolder::Error::CantOpen if the file cannot be opened.
*/
inline std::vector<uint8_t> contents_of(const std::string &file_name) {
	FileHolder file(file_name, FileMode::Read);
	return file.read(size_t(file.stats().st_size));
}

}
