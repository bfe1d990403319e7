// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "UniqueHandle.hxx"

#include <cassert>
#include <exception>
#include <optional>
#include <utility>

namespace Co {

namespace detail {

template<typename R>
class promise_result_manager {
	std::optional<R> value;

public:
	template<typename U>
	void return_value(U &&_value) noexcept {
		value.emplace(std::forward<U>(_value));
	}

	decltype(auto) GetReturnValue() noexcept {
		/* this assertion can fail if control flows off the
		   end of a coroutine without co_return, which is
		   undefined behavior */
		assert(value);

		return std::move(*value);
	}
};

template<>
class promise_result_manager<void> {
public:
	void return_void() noexcept {}
	void GetReturnValue() noexcept {}
};

} // namespace Co::detail

/**
 * A coroutine task which is suspended initially and returns a value
 * (with support for exceptions).  Destroying an unfinished task
 * destroys its coroutine frame, which is how callers cancel it.
 */
template<typename T>
class Task {
public:
	class promise_type : public detail::promise_result_manager<T> {
		std::coroutine_handle<> continuation;

		std::exception_ptr error;

	public:
		auto initial_suspend() noexcept {
			return std::suspend_always{};
		}

		struct final_awaitable {
			bool await_ready() const noexcept {
				return false;
			}

			template<typename PROMISE>
			std::coroutine_handle<> await_suspend(std::coroutine_handle<PROMISE> coro) noexcept {
				return coro.promise().continuation;
			}

			void await_resume() noexcept {
			}
		};

		auto final_suspend() noexcept {
			return final_awaitable{};
		}

		Task<T> get_return_object() noexcept {
			return Task<T>(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}

		void SetContinuation(std::coroutine_handle<> _continuation) noexcept {
			continuation = _continuation;
		}

		decltype(auto) GetReturnValue() {
			if (error)
				std::rethrow_exception(std::move(error));

			return detail::promise_result_manager<T>::GetReturnValue();
		}
	};

private:
	UniqueHandle<promise_type> coroutine;

	explicit Task(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	Task() = default;

	auto operator co_await() const noexcept {
		struct Awaitable final {
			const std::coroutine_handle<promise_type> coroutine;

			bool await_ready() const noexcept {
				return coroutine.done();
			}

			std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
				coroutine.promise().SetContinuation(continuation);
				return coroutine;
			}

			decltype(auto) await_resume() {
				return coroutine.promise().GetReturnValue();
			}
		};

		return Awaitable{coroutine.get()};
	}
};

} // namespace Co
