//
//  ActionQueue.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace Concurrency {

/*!
	An action queue allows a caller to enqueue void(void) functions that will be performed
	serially, in the order enqueued, but not until the owner next calls @c perform().

	This is a single-threaded relative of TaskQueue<false>: nothing is performed on any thread
	other than the one that calls @c perform(), so actions can never be observed out of order
	relative to the logical step that enqueued them.
*/
class ActionQueue {
public:
	/// Enqueues @c action to be performed upon the next call to @c perform().
	void enqueue(std::function<void(void)> action) {
		actions_.push_back(std::move(action));
	}

	/*!
		Performs all actions that were enqueued before this call began, in order. Anything enqueued
		by those actions is retained for the next call.

		@returns @c true if any action was performed; @c false otherwise.
	*/
	bool perform() {
		if(actions_.empty()) {
			return false;
		}

		ActionVector actions;
		std::swap(actions, actions_);
		for(const auto &action: actions) {
			action();
		}
		return true;
	}

	/// Calls @c perform() until the queue is exhausted.
	void flush() {
		while(perform());
	}

	/// @returns @c true if no actions are currently enqueued; @c false otherwise.
	bool empty() const {
		return actions_.empty();
	}

private:
	using ActionVector = std::vector<std::function<void(void)>>;
	ActionVector actions_;
};

}
