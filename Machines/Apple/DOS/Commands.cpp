//
//  Commands.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Commands.hpp"
#include "Arguments.hpp"
#include "Errors.hpp"

#include "Outputs/Log.hpp"

#include <charconv>

// Command syntax is per the Apple DOS 3.3 manual; see also Beneath Apple DOS.

using namespace Apple::DOS;

namespace {
using Logger = Log::Logger<Log::Source::DOSCommands>;

enum class Shape {
	ArgumentsOnly,		// e.g. MON,C,I,O
	Filename,			// e.g. OPEN filename,L20
	OptionalFilename,	// i.e. CLOSE [filename]
	TwoFilenames,		// i.e. RENAME old,new
	Slot,				// i.e. PR# slot
};

struct Form {
	std::string_view keyword;
	Command::Name name;
	Shape shape;
};

constexpr Form forms[] = {
	{"MON",			Command::Name::Monitor,		Shape::ArgumentsOnly},
	{"NOMON",		Command::Name::NoMonitor,	Shape::ArgumentsOnly},
	{"OPEN",		Command::Name::Open,		Shape::Filename},
	{"APPEND",		Command::Name::Append,		Shape::Filename},
	{"CLOSE",		Command::Name::Close,		Shape::OptionalFilename},
	{"POSITION",	Command::Name::Position,	Shape::Filename},
	{"READ",		Command::Name::Read,		Shape::Filename},
	{"WRITE",		Command::Name::Write,		Shape::Filename},
	{"DELETE",		Command::Name::Delete,		Shape::Filename},
	{"RENAME",		Command::Name::Rename,		Shape::TwoFilenames},
	{"PR#",			Command::Name::PrintSlot,	Shape::Slot},
};

constexpr bool is_printable(const char c) {
	return c >= 0x20 && c <= 0x7e;
}

/// Walks a command line; everything from the first unprintable character onwards is ignored.
class Scanner {
public:
	Scanner(const std::string_view line) : line_(line) {}

	void skip_spaces() {
		while(cursor_ < line_.size() && (line_[cursor_] == ' ' || line_[cursor_] == '\t')) ++cursor_;
	}

	/// Skips leading whitespace, then returns the run of printable non-comma characters that follows.
	std::string filename() {
		skip_spaces();
		const auto start = cursor_;
		while(cursor_ < line_.size() && is_printable(line_[cursor_]) && line_[cursor_] != ',') ++cursor_;
		return std::string(line_.substr(start, cursor_ - start));
	}

	/*!
		As per @c filename(), but a filename is mandatory. If the run after the whitespace is empty,
		the final space is taken back as a one-character filename.

		@throws Fault(Error::InvalidOption) if there is no filename, even of a single space.
	*/
	std::string required_filename() {
		const auto start = cursor_;
		auto name = filename();
		if(name.empty()) {
			if(cursor_ == start || line_[cursor_ - 1] != ' ') {
				throw Fault(Error::InvalidOption);
			}
			name = " ";
		}
		return name;
	}

	/// @returns The run of printable characters from the current position.
	std::string printable() {
		const auto start = cursor_;
		while(cursor_ < line_.size() && is_printable(line_[cursor_])) ++cursor_;
		return std::string(line_.substr(start, cursor_ - start));
	}

	/// @returns A comma and all printable characters after it, if the next character is a comma; otherwise the empty string.
	std::string tail() {
		if(!consume(',')) return "";
		return "," + printable();
	}

	bool consume(const char c) {
		if(cursor_ < line_.size() && line_[cursor_] == c) {
			++cursor_;
			return true;
		}
		return false;
	}

	void advance(const std::size_t length) {
		cursor_ += length;
	}

private:
	std::string_view line_;
	std::size_t cursor_ = 0;
};

}

Command Apple::DOS::tokenise(const std::string_view line) {
	if(line.empty()) {
		return Command{Command::Name::Null, {}, {}, {}};
	}

	for(const auto &form: forms) {
		if(line.substr(0, form.keyword.size()) != form.keyword) {
			continue;
		}

		Command command{form.name, {}, {}, {}};
		Scanner scanner(line);
		scanner.advance(form.keyword.size());

		switch(form.shape) {
			case Shape::ArgumentsOnly:
				command.tail = scanner.printable();
			break;

			case Shape::Filename:
			case Shape::Slot:
				command.filename = scanner.required_filename();
				command.tail = scanner.tail();
			break;

			case Shape::OptionalFilename:
				command.filename = scanner.filename();
				command.tail = scanner.tail();
			break;

			case Shape::TwoFilenames:
				command.filename = scanner.required_filename();
				if(!scanner.consume(',')) {
					throw Fault(Error::InvalidOption);
				}
				command.filename2 = scanner.required_filename();
				command.tail = scanner.tail();
			break;
		}
		return command;
	}

	throw Fault(Error::InvalidOption);
}

CommandDispatcher::CommandDispatcher(Session &session, BufferManager &buffers, Terminal &terminal) :
	session_(session), buffers_(buffers), terminal_(terminal) {}

void CommandDispatcher::execute(const std::string &line) {
	if(session_.monitor & Monitor::Commands) {
		terminal_.write_string(line + "\r");
	}

	try {
		perform(tokenise(line));
	} catch(const Fault &fault) {
		Logger::error().append("%s failed: %s (%d)", line.c_str(), fault.what(), fault.code());
		throw;
	}
	Logger::info().append("Performed \"%s\"", line.c_str());
}

void CommandDispatcher::perform(const Command &command) {
	switch(command.name) {
		case Command::Name::Monitor: {
			const auto arguments = parse_arguments(command.tail, "ICO");
			if(arguments.is_present('I')) session_.monitor |= Monitor::Input;
			if(arguments.is_present('C')) session_.monitor |= Monitor::Commands;
			if(arguments.is_present('O')) session_.monitor |= Monitor::Output;
		} break;

		case Command::Name::NoMonitor: {
			const auto arguments = parse_arguments(command.tail, "ICO");
			if(arguments.is_present('I')) session_.monitor &= ~Monitor::Input;
			if(arguments.is_present('C')) session_.monitor &= ~Monitor::Commands;
			if(arguments.is_present('O')) session_.monitor &= ~Monitor::Output;
		} break;

		case Command::Name::Open:
			buffers_.open(command.filename, parse_arguments(command.tail, "L").length());
		break;

		case Command::Name::Append:
			buffers_.append(command.filename, parse_arguments(command.tail, "L").length());
		break;

		case Command::Name::Close:
			parse_arguments(command.tail);	// Permits no arguments; this just validates.
			if(command.filename.empty()) {
				buffers_.close_all();
			} else {
				buffers_.close(command.filename);
			}
		break;

		case Command::Name::Position:
			buffers_.position(command.filename, parse_arguments(command.tail, "R").record());
		break;

		case Command::Name::Read: {
			const auto arguments = parse_arguments(command.tail, "RB");
			buffers_.read(command.filename, arguments.record(), arguments.byte());
		} break;

		case Command::Name::Write: {
			const auto arguments = parse_arguments(command.tail, "RB");
			buffers_.write(command.filename, arguments.record(), arguments.byte());
		} break;

		case Command::Name::Delete:
			parse_arguments(command.tail);
			buffers_.unlink(command.filename);
		break;

		case Command::Name::Rename:
			parse_arguments(command.tail);
			buffers_.rename(command.filename, command.filename2);
		break;

		case Command::Name::PrintSlot: {
			parse_arguments(command.tail);

			// The slot is taken as a decimal number, ignoring trailing whitespace; anything
			// that isn't slot 0 or slot 3 is out of range.
			std::string_view text = command.filename;
			while(!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

			int slot = -1;
			const auto result = std::from_chars(text.data(), text.data() + text.size(), slot);
			if(result.ec != std::errc() || result.ptr != text.data() + text.size()) {
				slot = -1;
			}

			switch(slot) {
				case 0:	terminal_.set_firmware_active(false);	break;
				case 3:	terminal_.set_firmware_active(true);	break;
				default: throw Fault(Error::RangeError);
			}
		} break;

		case Command::Name::Null:
			session_.deactivate();
		break;
	}
}
