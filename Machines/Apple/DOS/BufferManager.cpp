//
//  BufferManager.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "BufferManager.hpp"
#include "Errors.hpp"

#include "Outputs/Log.hpp"

#include <cassert>
#include <limits>
#include <new>
#include <stdexcept>

using namespace Apple::DOS;

namespace {
using Logger = Log::Logger<Log::Source::DOSBuffers>;

/// @returns @c base + @c count * @c stride.
/// @throws Fault(Error::InvalidOption) if that isn't representable as a file offset.
std::size_t offset(const std::size_t base, const std::size_t count, const std::size_t stride) {
	constexpr auto limit = std::numeric_limits<std::size_t>::max();
	if(stride && count > limit / stride) {
		throw Fault(Error::InvalidOption);
	}
	if(count * stride > limit - base) {
		throw Fault(Error::InvalidOption);
	}
	return base + count * stride;
}

}

BufferManager::BufferManager(Session &session, Storage::KeyValue::Store &store, Storage::KeyValue::ContentSource *const source) :
	session_(session), store_(store), source_(source) {}

// MARK: - Internals.

std::optional<std::string> BufferManager::load(const std::string &name) {
	try {
		if(auto content = store_.get(name); content.has_value()) {
			return content;
		}

		// Seed content is cached into the store so that it is fetched at most once.
		if(source_) {
			auto content = source_->fetch(name);
			if(content.has_value()) {
				store_.set(name, *content);
			}
			return content;
		}
	} catch(Storage::KeyValue::Error) {
		Logger::error().append("Store failure while loading %s", name.c_str());
		throw Fault(Error::IOError);
	}

	return std::nullopt;
}

void BufferManager::flush(const Buffer &buffer) {
	// A buffer that never acquired content has nothing to write back.
	if(!buffer.content.has_value()) {
		return;
	}

	try {
		store_.set(buffer.name, *buffer.content);
	} catch(Storage::KeyValue::Error) {
		Logger::error().append("Store failure while writing %s", buffer.name.c_str());
		throw Fault(Error::IOError);
	}
}

Buffer *BufferManager::find(const std::string &name) {
	const auto buffer = session_.buffers.find(name);
	return buffer == session_.buffers.end() ? nullptr : &buffer->second;
}

std::optional<std::string> BufferManager::current_content(const std::string &name) {
	if(const auto buffer = find(name); buffer) {
		return buffer->content;
	}
	return load(name);
}

Buffer &BufferManager::emplace(const std::string &name, const std::size_t record_length, std::optional<std::string> &&content) {
	if(const auto existing = find(name); existing) {
		flush(*existing);
		if(session_.active == existing) {
			session_.deactivate();
		}
		session_.buffers.erase(name);
	}

	auto &buffer = session_.buffers.try_emplace(name, name, std::move(content), record_length).first->second;
	Logger::info().append(
		"Opened %s; record length %zu, %s",
			name.c_str(),
			buffer.record_length,
			buffer.content.has_value() ? "existing file" : "new file"
	);
	return buffer;
}

Buffer &BufferManager::active_buffer([[maybe_unused]] const Mode mode) {
	assert(session_.active && session_.mode == mode && session_.active->content.has_value());
	return *session_.active;
}

// MARK: - Commands.

void BufferManager::open(const std::string &name, const std::size_t record_length) {
	emplace(name, record_length, current_content(name));
}

void BufferManager::append(const std::string &name, const std::size_t record_length) {
	auto content = current_content(name);
	if(!content.has_value()) {
		throw Fault(Error::FileNotFound);
	}

	auto &buffer = emplace(name, record_length, std::move(content));
	buffer.file_pointer = buffer.content->size();
	buffer.record_number = buffer.file_pointer / buffer.record_length;
}

void BufferManager::close(const std::string &name) {
	const auto buffer = find(name);
	if(!buffer) {
		return;
	}

	flush(*buffer);
	if(session_.active == buffer) {
		session_.deactivate();
	}
	session_.buffers.erase(name);
	Logger::info().append("Closed %s", name.c_str());
}

void BufferManager::close_all() {
	// Write everything back before discarding anything, so that a failure leaves all buffers open.
	for(const auto &buffer: session_.buffers) {
		flush(buffer.second);
	}

	Logger::info().append("Closed all %zu buffers", session_.buffers.size());
	session_.buffers.clear();
	session_.deactivate();
}

void BufferManager::position(const std::string &name, const std::size_t records) {
	auto buffer = find(name);
	if(!buffer) {
		buffer = &emplace(name, 0, load(name));
	}

	const auto file_pointer = offset(buffer->file_pointer, records, buffer->record_length);
	buffer->record_number = offset(buffer->record_number, records, 1);
	buffer->file_pointer = file_pointer;
}

void BufferManager::read(const std::string &name, const std::size_t record, const std::size_t byte) {
	auto buffer = find(name);
	if(!buffer) {
		auto content = load(name);
		if(!content.has_value()) {
			throw Fault(Error::FileNotFound);
		}
		buffer = &emplace(name, 0, std::move(content));
	} else if(!buffer->content.has_value()) {
		throw Fault(Error::FileNotFound);
	}

	buffer->file_pointer = offset(byte, record, buffer->record_length);
	buffer->record_number = record;

	session_.active = buffer;
	session_.mode = Mode::Read;
}

void BufferManager::write(const std::string &name, const std::size_t record, const std::size_t byte) {
	const auto buffer = find(name);
	if(!buffer) {
		throw Fault(Error::FileNotFound);
	}

	// Sequential-access files ignore the record number for positioning purposes.
	const auto file_pointer = buffer->record_length > 1 ?
		offset(byte, record, buffer->record_length) :
		offset(buffer->file_pointer, byte, 1);

	if(!buffer->content.has_value()) {
		try {
			store_.set(name, "");
		} catch(Storage::KeyValue::Error) {
			throw Fault(Error::IOError);
		}
		buffer->content.emplace();
		Logger::info().append("Created %s", name.c_str());
	}

	buffer->record_number = record;
	buffer->file_pointer = file_pointer;

	session_.active = buffer;
	session_.mode = Mode::Write;
}

void BufferManager::unlink(const std::string &name) {
	try {
		if(!store_.get(name).has_value()) {
			throw Fault(Error::FileNotFound);
		}
		store_.remove(name);
	} catch(Storage::KeyValue::Error) {
		throw Fault(Error::IOError);
	}
	Logger::info().append("Deleted %s", name.c_str());
}

void BufferManager::rename(const std::string &from, const std::string &to) {
	try {
		const auto content = store_.get(from);
		if(!content.has_value()) {
			throw Fault(Error::FileNotFound);
		}
		if(from == to) {
			return;
		}

		store_.set(to, *content);
		store_.remove(from);
	} catch(Storage::KeyValue::Error) {
		throw Fault(Error::IOError);
	}
	Logger::info().append("Renamed %s to %s", from.c_str(), to.c_str());
}

// MARK: - Character I/O.

char BufferManager::read_character() {
	auto &buffer = active_buffer(Mode::Read);
	const auto &content = *buffer.content;

	if(buffer.file_pointer >= content.size()) {
		throw Fault(Error::EndOfData);
	}
	return content[buffer.file_pointer++];
}

std::string BufferManager::read_line() {
	auto &buffer = active_buffer(Mode::Read);
	const auto &content = *buffer.content;

	if(buffer.file_pointer >= content.size()) {
		throw Fault(Error::EndOfData);
	}

	std::string line;
	while(buffer.file_pointer < content.size()) {
		const char c = content[buffer.file_pointer++];
		if(c == '\r' || c == '\n' || c == '\0') {
			break;
		}
		line.push_back(c);
	}
	return line;
}

void BufferManager::write_character(const char c) {
	auto &buffer = active_buffer(Mode::Write);
	auto &content = *buffer.content;

	// Writing beyond the end of the file leaves a gap of NULs, as per a sparse random-access file.
	if(buffer.file_pointer > content.size()) {
		try {
			content.resize(buffer.file_pointer, '\0');
		} catch(const std::length_error &) {
			Logger::error().append("Can't extend %s to %zu bytes", buffer.name.c_str(), buffer.file_pointer);
			throw Fault(Error::IOError);
		} catch(const std::bad_alloc &) {
			Logger::error().append("Can't extend %s to %zu bytes", buffer.name.c_str(), buffer.file_pointer);
			throw Fault(Error::IOError);
		}
	}

	if(buffer.file_pointer == content.size()) {
		content.push_back(c);
	} else {
		content[buffer.file_pointer] = c;
	}
	++buffer.file_pointer;
}
