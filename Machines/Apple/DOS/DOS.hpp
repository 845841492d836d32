//
//  DOS.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "BufferManager.hpp"
#include "Channel.hpp"
#include "Commands.hpp"
#include "Session.hpp"
#include "Terminal.hpp"

#include "Concurrency/ActionQueue.hpp"
#include "Storage/KeyValue/Store.hpp"

namespace Apple::DOS {

struct Options {
	/// Initial MON flags; a combination of values from Monitor.
	int monitor = 0;
};

/*!
	Provides the text-file portion of Apple DOS 3.3 to an application that performs its I/O via
	@c terminal(), backed by the original terminal and by @c store.

	Usage:

		Apple::DOS::DOS dos(console, store, queue);
		application.set_terminal(dos.terminal());
		...
		queue.perform();	// Delivers any input read from files.
*/
class DOS {
public:
	DOS(
		Terminal &terminal,
		Storage::KeyValue::Store &store,
		Concurrency::ActionQueue &deliveries,
		Storage::KeyValue::ContentSource *source = nullptr,
		const Options &options = {}
	);

	/// @returns The terminal through which the application should perform all I/O.
	Terminal &terminal() {
		return channel_;
	}

	/// Abandons all open files without writing them back, and cancels any READ, WRITE or partial command.
	void reset();

	const Session &session() const {
		return session_;
	}

private:
	Session session_;
	BufferManager buffers_;
	CommandDispatcher dispatcher_;
	Channel channel_;
	Options options_;
};

}
