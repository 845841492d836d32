//
//  SeedDirectory.hpp
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
	A ContentSource backed by a read-only host directory of text files.

	The name FOO.BAR is sought as FOO_BAR.txt, with the underscored name percent-encoded as per
	@c percent_encode. Files may be either plain or gzip-compressed. Carriage return plus line feed
	pairs are reduced to a single carriage return, that being the Apple II line terminator.
*/
class SeedDirectory: public ContentSource {
public:
	SeedDirectory(const std::string &base_path);

	/*!
		@returns The seed content for @c name, or @c std::nullopt if there is no such seed.
		@throws Error::CantRead if the seed exists but cannot be read or decompressed.
	*/
	std::optional<std::string> fetch(const std::string &name) override;

	/// @returns The host path that would be consulted for @c name.
	std::string path_for(const std::string &name) const;

private:
	std::string base_path_;
};

}
