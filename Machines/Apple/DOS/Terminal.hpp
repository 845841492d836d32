//
//  Terminal.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <functional>
#include <string>

namespace Apple::DOS {

/*!
	The character-oriented console through which an application performs all of its I/O.

	Reads never return their result directly: it is delivered to the supplied callback at some
	later point, possibly but not necessarily after the read call has returned.
*/
struct Terminal {
	using CharacterReceiver = std::function<void(char)>;
	using LineReceiver = std::function<void(const std::string &)>;

	virtual ~Terminal() = default;

	virtual void write_character(char) = 0;
	virtual void read_character(CharacterReceiver) = 0;
	virtual void read_line(LineReceiver, const std::string &prompt) = 0;

	/// Writes each character of @c string in turn.
	virtual void write_string(const std::string &string) {
		for(const char c: string) {
			write_character(c);
		}
	}

	/// Enables or disables the terminal's 80-column firmware, if it has any.
	virtual void set_firmware_active(bool) {}
};

}
