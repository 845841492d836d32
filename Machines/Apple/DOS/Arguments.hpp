//
//  Arguments.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace Apple::DOS {

/*!
	The keyword arguments that may follow a DOS command, e.g. the ",R3,B$10" of
	"READ FILE,R3,B$10".

	V, D, S, L, R, B and A take numeric values; C, I and O are flags. Any letter may have been
	supplied or not; numeric letters read as 0 when not supplied.
*/
class Arguments {
public:
	static constexpr std::string_view Letters = "VDSLRBACIO";

	/// @returns The value most recently supplied for @c letter, or 0 if none was supplied.
	uint32_t value(char letter) const;

	/// @returns @c true if @c letter appeared at least once; @c false otherwise.
	bool is_present(char letter) const;

	/// Records that @c letter was supplied with @c value.
	void set(char letter, uint32_t value);

	uint32_t volume() const	{	return value('V');	}
	uint32_t drive() const	{	return value('D');	}
	uint32_t slot() const	{	return value('S');	}
	uint32_t length() const	{	return value('L');	}
	uint32_t record() const	{	return value('R');	}
	uint32_t byte() const	{	return value('B');	}
	uint32_t address() const	{	return value('A');	}

private:
	struct Slot {
		bool present = false;
		uint32_t value = 0;
	};
	std::array<Slot, Letters.size()> slots_{};
};

/*!
	Parses @c tail as a sequence of zero or more arguments, each of the form:

		[,] letter [value]

	... with optional whitespace either side of the letter and value. A value is either a decimal
	number or a '$' followed by hexadecimal digits. If a letter is repeated, the final value wins.

	@throws Fault(Error::InvalidOption) if @c tail contains a letter not listed in @c allowed,
		any text that isn't a valid argument, or a value that doesn't fit in 32 bits.
*/
Arguments parse_arguments(std::string_view tail, std::string_view allowed = {});

}
