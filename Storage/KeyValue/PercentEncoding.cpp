//
//  PercentEncoding.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "PercentEncoding.hpp"

#include <cstdint>

namespace {

constexpr bool is_unreserved(const uint8_t c) {
	return
		(c >= 'A' && c <= 'Z') ||
		(c >= 'a' && c <= 'z') ||
		(c >= '0' && c <= '9') ||
		c == '-' || c == '.' || c == '_' || c == '~';
}

}

std::string Storage::KeyValue::percent_encode(const std::string_view source) {
	static constexpr char hex[] = "0123456789ABCDEF";

	std::string result;
	result.reserve(source.size());
	for(const char c: source) {
		const auto byte = uint8_t(c);
		if(is_unreserved(byte)) {
			result.push_back(c);
			continue;
		}

		result.push_back('%');
		result.push_back(hex[byte >> 4]);
		result.push_back(hex[byte & 0xf]);
	}

	// A bare "." or ".." would alias a directory; '.' is otherwise unreserved.
	if(result == "." || result == "..") {
		result.replace(0, 1, "%2E");
	}
	return result;
}
