//
//  Store.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace Storage::KeyValue {

enum class Error {
	CantRead,
	CantWrite,
};

/*!
	A Store is a flat, durable mapping from names to byte strings; there are no directories and no
	metadata beyond the name. A name that has never been set is distinct from a name that maps to an
	empty string.

	Implementations throw Storage::KeyValue::Error if the backing medium fails.
*/
struct Store {
	virtual ~Store() = default;

	/// @returns The content most recently set for @c name, or @c std::nullopt if there is none.
	virtual std::optional<std::string> get(const std::string &name) = 0;

	/// Replaces any content stored for @c name with @c content.
	virtual void set(const std::string &name, const std::string &content) = 0;

	/// Removes @c name from the store; does nothing if @c name is not present.
	virtual void remove(const std::string &name) = 0;
};

/*!
	A ContentSource supplies the initial content for names that a Store has never seen,
	e.g. a collection of files that shipped alongside the program.
*/
struct ContentSource {
	virtual ~ContentSource() = default;

	/// @returns The initial content for @c name, or @c std::nullopt if this source has none.
	virtual std::optional<std::string> fetch(const std::string &name) = 0;
};

/// A Store that lives only as long as the process.
class MemoryStore: public Store {
public:
	std::optional<std::string> get(const std::string &name) override {
		const auto entry = entries_.find(name);
		if(entry == entries_.end()) return std::nullopt;
		return entry->second;
	}

	void set(const std::string &name, const std::string &content) override {
		entries_[name] = content;
	}

	void remove(const std::string &name) override {
		entries_.erase(name);
	}

private:
	std::unordered_map<std::string, std::string> entries_;
};

}
