//
//  SeedDirectory.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "SeedDirectory.hpp"
#include "PercentEncoding.hpp"

#include "Outputs/Log.hpp"

#include <sys/stat.h>
#include <algorithm>
#include <array>
#include <zlib.h>

using namespace Storage::KeyValue;

namespace {
using Logger = Log::Logger<Log::Source::KeyValueStore>;

/// Reads the whole of @c path through zlib, which passes uncompressed files through untouched.
std::string gzcontents_of(const std::string &path) {
	const gzFile file = gzopen(path.c_str(), "rb");
	if(!file) {
		throw Error::CantRead;
	}

	std::string result;
	std::array<char, 4096> buffer;
	while(true) {
		const int bytes_read = gzread(file, buffer.data(), unsigned(buffer.size()));
		if(bytes_read < 0) {
			int error_number;
			Logger::error().append("Can't decompress %s: %s", path.c_str(), gzerror(file, &error_number));
			gzclose(file);
			throw Error::CantRead;
		}
		if(!bytes_read) break;
		result.append(buffer.data(), size_t(bytes_read));
	}

	gzclose(file);
	return result;
}

}

SeedDirectory::SeedDirectory(const std::string &base_path) : base_path_(base_path) {
	if(!base_path_.empty() && base_path_.back() != '/') {
		base_path_ += '/';
	}
}

std::string SeedDirectory::path_for(const std::string &name) const {
	std::string underscored = name;
	std::replace(underscored.begin(), underscored.end(), '.', '_');
	return base_path_ + percent_encode(underscored) + ".txt";
}

std::optional<std::string> SeedDirectory::fetch(const std::string &name) {
	const auto path = path_for(name);

	struct stat file_stats;
	if(stat(path.c_str(), &file_stats)) {
		return std::nullopt;
	}

	const std::string raw = gzcontents_of(path);

	// Reduce CR LF to CR.
	std::string content;
	content.reserve(raw.size());
	for(size_t c = 0; c < raw.size(); c++) {
		content.push_back(raw[c]);
		if(raw[c] == '\r' && c + 1 < raw.size() && raw[c + 1] == '\n') {
			++c;
		}
	}

	Logger::info().append("Seeded %s from %s", name.c_str(), path.c_str());
	return content;
}
