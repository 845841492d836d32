//
//  DOS.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "DOS.hpp"

#include "Outputs/Log.hpp"

using namespace Apple::DOS;

DOS::DOS(
	Terminal &terminal,
	Storage::KeyValue::Store &store,
	Concurrency::ActionQueue &deliveries,
	Storage::KeyValue::ContentSource *const source,
	const Options &options
) :
	buffers_(session_, store, source),
	dispatcher_(session_, buffers_, terminal),
	channel_(terminal, session_, buffers_, dispatcher_, deliveries),
	options_(options)
{
	session_.monitor = options_.monitor;
}

void DOS::reset() {
	Log::Logger<Log::Source::DOSBuffers>::info().append("Reset; discarding %zu buffers", session_.buffers.size());
	session_.reset();
	session_.monitor = options_.monitor;
}
