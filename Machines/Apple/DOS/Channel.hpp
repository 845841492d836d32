//
//  Channel.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "BufferManager.hpp"
#include "Commands.hpp"
#include "Session.hpp"
#include "Terminal.hpp"

#include "Concurrency/ActionQueue.hpp"

namespace Apple::DOS {

/*!
	A Terminal that sits between an application and the real terminal, observing all character
	traffic.

	Output that begins with a Ctrl-D is collected as a DOS command until the next carriage return,
	then executed. While a READ is in effect, character and line input come from the active buffer;
	while a WRITE is in effect, output goes to it. All other traffic passes straight through.

	Input supplied from a buffer is delivered via @c deliveries, in order, when its owner next calls
	@c perform(); it is never delivered from within the read call.
*/
class Channel: public Terminal {
public:
	static constexpr char CommandCharacter = 0x04;	// i.e. Ctrl-D.
	static constexpr char LineTerminator = '\r';

	Channel(Terminal &terminal, Session &, BufferManager &, CommandDispatcher &, Concurrency::ActionQueue &deliveries);

	void write_character(char) override;
	void read_character(CharacterReceiver) override;
	void read_line(LineReceiver, const std::string &prompt) override;
	void set_firmware_active(bool) override;

private:
	Terminal &terminal_;
	Session &session_;
	BufferManager &buffers_;
	CommandDispatcher &dispatcher_;
	Concurrency::ActionQueue &deliveries_;
};

}
