//
//  FileHolder.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 21/11/2016.
//  Copyright 2016 Thomas Harte. All rights reserved.
//

#include "FileHolder.hpp"

using namespace Storage;

FileHolder::~FileHolder() {
	if(file_) std::fclose(file_);
}

FileHolder::FileHolder(const std::string &file_name, const FileMode mode) {
	switch(mode) {
		case FileMode::Read:
			file_ = std::fopen(file_name.c_str(), "rb");
		break;

		case FileMode::Rewrite:
			file_ = std::fopen(file_name.c_str(), "wb");
		break;
	}

	if(!file_) throw Error::CantOpen;
	fstat(fileno(file_), &file_stats_);
}

std::vector<uint8_t> FileHolder::read(const std::size_t size) {
	std::vector<uint8_t> result(size);
	result.resize(std::fread(result.data(), 1, size, file_));
	return result;
}

void FileHolder::write(const uint8_t *const buffer, const std::size_t size) {
	if(std::fwrite(buffer, 1, size, file_) != size) {
		throw Error::CantWrite;
	}
}

void FileHolder::flush() {
	if(std::fflush(file_)) {
		throw Error::CantWrite;
	}
}

const struct stat &FileHolder::stats() const {
	return file_stats_;
}
