//
//  DirectoryStore.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "Store.hpp"

#include <string>

namespace Storage::KeyValue {

/*!
	A Store that keeps each entry as a single file within a 'vfs' subdirectory of a nominated
	host directory. Host file names are the percent-encoded form of the entry names, so any
	name round-trips.
*/
class DirectoryStore: public Store {
public:
	/*!
		Uses @c base_path as the containing directory, creating it and its 'vfs' subdirectory
		if necessary.

		@throws Error::CantWrite if either directory cannot be created.
	*/
	DirectoryStore(const std::string &base_path);

	std::optional<std::string> get(const std::string &) override;
	void set(const std::string &, const std::string &) override;
	void remove(const std::string &) override;

	/// @returns The host path used to store @c name.
	std::string path_for(const std::string &name) const;

private:
	std::string base_path_;
};

}
