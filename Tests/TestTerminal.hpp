//
//  TestTerminal.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "Machines/Apple/DOS/Errors.hpp"
#include "Machines/Apple/DOS/Terminal.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <optional>
#include <string>

namespace Fixtures {

/// A terminal that records all output and supplies input from canned strings, synchronously.
class RecordingTerminal: public Apple::DOS::Terminal {
public:
	std::string output;
	std::string characters;
	std::deque<std::string> lines;
	std::optional<bool> firmware_active;

	void write_character(const char c) override {
		output.push_back(c);
	}

	void read_character(CharacterReceiver receiver) override {
		ASSERT_FALSE(characters.empty());
		const char c = characters.front();
		characters.erase(0, 1);
		receiver(c);
	}

	void read_line(LineReceiver receiver, const std::string &prompt) override {
		ASSERT_FALSE(lines.empty());
		output += prompt;
		const auto line = lines.front();
		lines.pop_front();
		receiver(line);
	}

	void set_firmware_active(const bool active) override {
		firmware_active = active;
	}
};

/// Performs @c action, expecting it to throw a Fault with the code @c error.
template <typename ActionT>
void expect_fault(ActionT &&action, const Apple::DOS::Error error) {
	try {
		action();
		ADD_FAILURE() << "Expected fault " << int(error) << " was not raised";
	} catch(const Apple::DOS::Fault &fault) {
		EXPECT_EQ(fault.code(), int(error));
		EXPECT_STREQ(fault.what(), Apple::DOS::message(error));
	}
}

}
