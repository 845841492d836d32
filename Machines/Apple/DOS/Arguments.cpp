//
//  Arguments.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Arguments.hpp"
#include "Errors.hpp"

#include <limits>

using namespace Apple::DOS;

namespace {

constexpr bool is_space(const char c) {
	return c == ' ' || c == '\t';
}

constexpr int digit_value(const char c, const int base) {
	int value = -1;
	if(c >= '0' && c <= '9') value = c - '0';
	else if(c >= 'A' && c <= 'F') value = c - 'A' + 10;
	else if(c >= 'a' && c <= 'f') value = c - 'a' + 10;
	return value < base ? value : -1;
}

std::size_t index_of(const char letter) {
	const auto index = Arguments::Letters.find(letter);
	if(index == std::string_view::npos) {
		throw Fault(Error::InvalidOption);
	}
	return index;
}

}

uint32_t Arguments::value(const char letter) const {
	return slots_[index_of(letter)].value;
}

bool Arguments::is_present(const char letter) const {
	return slots_[index_of(letter)].present;
}

void Arguments::set(const char letter, const uint32_t value) {
	auto &slot = slots_[index_of(letter)];
	slot.present = true;
	slot.value = value;
}

Arguments Apple::DOS::parse_arguments(const std::string_view tail, const std::string_view allowed) {
	Arguments arguments;

	const auto skip_spaces = [&](std::size_t &cursor) {
		while(cursor < tail.size() && is_space(tail[cursor])) ++cursor;
	};

	// Consumes digits of the specified base from @c cursor onwards, if there are any.
	const auto parse_number = [&](std::size_t &cursor, const int base) {
		uint64_t result = 0;
		while(cursor < tail.size()) {
			const int digit = digit_value(tail[cursor], base);
			if(digit < 0) break;

			result = result * uint64_t(base) + uint64_t(digit);
			if(result > std::numeric_limits<uint32_t>::max()) {
				throw Fault(Error::InvalidOption);
			}
			++cursor;
		}
		return uint32_t(result);
	};

	std::size_t position = 0;
	while(true) {
		std::size_t cursor = position;
		if(cursor < tail.size() && tail[cursor] == ',') ++cursor;
		skip_spaces(cursor);

		if(cursor == tail.size() || Arguments::Letters.find(tail[cursor]) == std::string_view::npos) {
			break;
		}
		const char letter = tail[cursor++];
		if(allowed.find(letter) == std::string_view::npos) {
			throw Fault(Error::InvalidOption);
		}
		skip_spaces(cursor);

		// A '$' not followed by at least one hex digit isn't part of a value, and will
		// therefore be left over as unparseable text.
		uint32_t value = 0;
		if(cursor < tail.size() && digit_value(tail[cursor], 10) >= 0) {
			value = parse_number(cursor, 10);
		} else if(
			cursor + 1 < tail.size() &&
			tail[cursor] == '$' &&
			digit_value(tail[cursor + 1], 16) >= 0
		) {
			++cursor;
			value = parse_number(cursor, 16);
		}
		skip_spaces(cursor);

		arguments.set(letter, value);
		position = cursor;
	}

	if(position != tail.size()) {
		throw Fault(Error::InvalidOption);
	}
	return arguments;
}
