//
//  DirectoryStore.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "DirectoryStore.hpp"
#include "PercentEncoding.hpp"

#include "Storage/FileHolder.hpp"
#include "Outputs/Log.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <cstdio>

using namespace Storage::KeyValue;

namespace {
using Logger = Log::Logger<Log::Source::KeyValueStore>;

constexpr char Namespace[] = "vfs/";

void ensure_directory(const std::string &path) {
	if(!mkdir(path.c_str(), 0755) || errno == EEXIST) {
		return;
	}
	Logger::error().append("Can't create directory %s", path.c_str());
	throw Error::CantWrite;
}

}

DirectoryStore::DirectoryStore(const std::string &base_path) : base_path_(base_path) {
	if(base_path_.empty()) {
		base_path_ = "./";
	} else if(base_path_.back() != '/') {
		base_path_ += '/';
	}

	ensure_directory(base_path_);
	ensure_directory(base_path_ + Namespace);
}

std::string DirectoryStore::path_for(const std::string &name) const {
	return base_path_ + Namespace + percent_encode(name);
}

std::optional<std::string> DirectoryStore::get(const std::string &name) {
	const auto path = path_for(name);

	struct stat file_stats;
	if(stat(path.c_str(), &file_stats)) {
		return std::nullopt;
	}

	try {
		const auto contents = Storage::contents_of(path);
		return std::string(contents.begin(), contents.end());
	} catch(Storage::FileHolder::Error) {
		Logger::error().append("Can't read %s", path.c_str());
		throw Error::CantRead;
	}
}

void DirectoryStore::set(const std::string &name, const std::string &content) {
	const auto path = path_for(name);

	try {
		Storage::FileHolder file(path, Storage::FileMode::Rewrite);
		file.write(reinterpret_cast<const uint8_t *>(content.data()), content.size());
		file.flush();
	} catch(Storage::FileHolder::Error) {
		Logger::error().append("Can't write %zu bytes to %s", content.size(), path.c_str());
		throw Error::CantWrite;
	}
	Logger::info().append("Stored %zu bytes as %s", content.size(), path.c_str());
}

void DirectoryStore::remove(const std::string &name) {
	const auto path = path_for(name);
	if(!std::remove(path.c_str()) || errno == ENOENT) {
		return;
	}

	Logger::error().append("Can't remove %s", path.c_str());
	throw Error::CantWrite;
}
