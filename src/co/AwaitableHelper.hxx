// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Compat.hxx"

#include <utility>

namespace Co {

/**
 * A helper class for implementing awaitables on top of callback
 * based operations.  Class #T must provide the methods IsReady()
 * and TakeValue() and an attribute "continuation" of type
 * std::coroutine_handle<> which gets resumed when the value becomes
 * available.
 *
 * @param rvalue if true, then TakeValue() is invoked on an rvalue
 */
template<typename T, bool rvalue=true>
struct AwaitableHelper {
	T &task;

	bool await_ready() const noexcept {
		return task.IsReady();
	}

	void await_suspend(std::coroutine_handle<> _continuation) noexcept {
		task.continuation = _continuation;
	}

	decltype(auto) await_resume() {
		if constexpr (rvalue)
			return std::move(task).TakeValue();
		else
			return task.TakeValue();
	}
};

} // namespace Co
