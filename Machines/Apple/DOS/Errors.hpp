//
//  Errors.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>

// Error numbers are those reported by Apple DOS 3.3 via ONERR GOTO, per
// Beneath Apple DOS, chapter 6.

namespace Apple::DOS {

enum class Error: uint8_t {
	LanguageNotAvailable = 1,
	RangeError = 2,
	WriteProtected = 4,
	EndOfData = 5,
	FileNotFound = 6,
	VolumeMismatch = 7,
	IOError = 8,
	DiskFull = 9,
	FileLocked = 10,
	InvalidOption = 11,
	NoBuffersAvailable = 12,
	FileTypeMismatch = 13,
	ProgramTooLarge = 14,
	NotDirectCommand = 15,
};

constexpr const char *message(const Error error) {
	switch(error) {
		case Error::LanguageNotAvailable:	return "Language not available";
		case Error::RangeError:				return "Range error";
		case Error::WriteProtected:			return "Write protected";
		case Error::EndOfData:				return "End of data";
		case Error::FileNotFound:			return "File not found";
		case Error::VolumeMismatch:			return "Volume mismatch";
		case Error::IOError:				return "I/O error";
		case Error::DiskFull:				return "Disk full";
		case Error::FileLocked:				return "File locked";
		case Error::InvalidOption:			return "Invalid option";
		case Error::NoBuffersAvailable:		return "No buffers available";
		case Error::FileTypeMismatch:		return "File type mismatch";
		case Error::ProgramTooLarge:		return "Program too large";
		case Error::NotDirectCommand:		return "Not direct command";
	}

	return "Unknown error";
}

/*!
	The single runtime fault raised by the DOS layer; carries both the numeric DOS error code and
	its standard message. Faults abort the current command or I/O call and are not caught within
	the DOS layer.
*/
class Fault: public std::runtime_error {
public:
	explicit Fault(const Error error) : std::runtime_error(message(error)), error_(error) {}

	Error error() const noexcept	{	return error_;		}
	int code() const noexcept		{	return int(error_);	}

private:
	Error error_;
};

}
