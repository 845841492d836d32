//
//  Channel.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Channel.hpp"

#include "Outputs/Log.hpp"

#include <utility>

using namespace Apple::DOS;

namespace {
using Logger = Log::Logger<Log::Source::DOSChannel>;
}

Channel::Channel(
	Terminal &terminal,
	Session &session,
	BufferManager &buffers,
	CommandDispatcher &dispatcher,
	Concurrency::ActionQueue &deliveries
) :
	terminal_(terminal), session_(session), buffers_(buffers), dispatcher_(dispatcher), deliveries_(deliveries) {}

void Channel::write_character(const char c) {
	if(session_.command_mode) {
		if(c == LineTerminator) {
			// Leave command mode before executing, so that a failed command leaves the channel idle.
			std::string command;
			std::swap(command, session_.command);
			session_.command_mode = false;

			dispatcher_.execute(command);
		} else {
			session_.command.push_back(c);
		}
		return;
	}

	if(c == CommandCharacter) {
		session_.command.clear();
		session_.command_mode = true;
		return;
	}

	if(session_.mode == Mode::Write) {
		if(session_.monitor & Monitor::Output) {
			terminal_.write_character(c);
		}
		buffers_.write_character(c);
		return;
	}

	terminal_.write_character(c);
}

void Channel::read_character(CharacterReceiver receiver) {
	if(session_.mode != Mode::Read) {
		terminal_.read_character(std::move(receiver));
		return;
	}

	const char c = buffers_.read_character();
	if(session_.monitor & Monitor::Input) {
		terminal_.write_character(c);
	}

	Logger::info().append("Read character %02x", uint8_t(c));
	deliveries_.enqueue([receiver = std::move(receiver), c] {
		receiver(c);
	});
}

void Channel::read_line(LineReceiver receiver, const std::string &prompt) {
	if(session_.mode != Mode::Read) {
		terminal_.read_line(std::move(receiver), prompt);
		return;
	}

	auto line = buffers_.read_line();
	if(session_.monitor & Monitor::Input) {
		terminal_.write_string(prompt + line + LineTerminator);
	}

	Logger::info().append("Read line \"%s\"", line.c_str());
	deliveries_.enqueue([receiver = std::move(receiver), line = std::move(line)] {
		receiver(line);
	});
}

void Channel::set_firmware_active(const bool active) {
	terminal_.set_firmware_active(active);
}
