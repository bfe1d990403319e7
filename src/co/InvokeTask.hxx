// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "UniqueHandle.hxx"
#include "util/BindMethod.hxx"

#include <cassert>
#include <exception>

namespace Co {

/**
 * A helper task which invokes a coroutine from synchronous code.
 * It is suspended initially; Start() runs it and the callback gets
 * invoked when it finishes.  Destroying the #InvokeTask cancels the
 * coroutine.
 */
class InvokeTask {
	using Callback = BoundMethod<void(std::exception_ptr error) noexcept>;

public:
	struct promise_type {
		Callback callback{nullptr};

		std::exception_ptr error;

		auto initial_suspend() noexcept {
			return std::suspend_always{};
		}

		struct final_awaitable {
			bool await_ready() const noexcept {
				return false;
			}

			template<typename PROMISE>
			void await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				auto &p = coro.promise();
				assert(p.callback);

				/* the callback may destroy this
				   coroutine */
				p.callback(std::move(p.error));
			}

			void await_resume() const noexcept {
			}
		};

		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		void return_void() noexcept {
		}

		InvokeTask get_return_object() noexcept {
			return InvokeTask(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	UniqueHandle<promise_type> coroutine;

	explicit InvokeTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	InvokeTask() = default;

	operator bool() const noexcept {
		return coroutine;
	}

	void Start(Callback callback) noexcept {
		assert(callback);
		assert(coroutine);
		assert(!coroutine->done());

		coroutine->promise().callback = callback;
		coroutine->resume();
	}
};

} // namespace Co
