//
//  Commands.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "BufferManager.hpp"
#include "Session.hpp"
#include "Terminal.hpp"

#include <string>
#include <string_view>

namespace Apple::DOS {

/*!
	A single tokenised DOS command line: the command, any file names and whatever
	argument text follows them.
*/
struct Command {
	enum class Name {
		Monitor,		// MON[,C][,I][,O]
		NoMonitor,		// NOMON[,C][,I][,O]
		Open,			// OPEN filename[,Llen]
		Append,			// APPEND filename[,Llen]
		Close,			// CLOSE [filename]
		Position,		// POSITION filename[,Rnum]
		Read,			// READ filename[,Rnum][,Bbyte]
		Write,			// WRITE filename[,Rnum][,Bbyte]
		Delete,			// DELETE filename
		Rename,			// RENAME filename,filename
		PrintSlot,		// PR# slot
		Null,			// [empty line]
	} name;

	std::string filename;
	std::string filename2;
	std::string tail;
};

/*!
	Identifies the command in @c line and separates out its file name or names, its argument
	tail, or for PR# its slot text.

	@throws Fault(Error::InvalidOption) if @c line isn't of the form of any recognised command.
*/
Command tokenise(std::string_view line);

/*!
	Executes complete DOS command lines, updating a Session via a BufferManager and reporting
	to a Terminal, which should be the terminal as it was before any DOS interception.
*/
class CommandDispatcher {
public:
	CommandDispatcher(Session &, BufferManager &, Terminal &);

	/*!
		Performs @c line, echoing it to the terminal first if commands are being monitored.

		@throws Fault if the command cannot be performed; in that case nothing has been modified.
	*/
	void execute(const std::string &line);

private:
	Session &session_;
	BufferManager &buffers_;
	Terminal &terminal_;

	void perform(const Command &);
};

}
