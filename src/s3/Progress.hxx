// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>

namespace S3 {

/**
 * Byte accounting for one logical fetch: how many bytes have been
 * forwarded to the consumer (across all attempts) and whether the
 * most recent attempt ended in a way that allows resuming.
 *
 * Both values live in one atomic word (the counter in the lower 63
 * bits, the flag in the top bit), so every operation is a single
 * lock-free update.
 */
class FetchProgress {
	static constexpr uint64_t RESUMABLE_BIT = uint64_t{1} << 63;

	std::atomic<uint64_t> value{0};

public:
	struct Snapshot {
		uint64_t seen = 0;
		bool resumable = false;

		constexpr bool operator==(const Snapshot &) const noexcept = default;
	};

	static constexpr Snapshot Decode(uint64_t v) noexcept {
		return {v & ~RESUMABLE_BIT, (v & RESUMABLE_BIT) != 0};
	}

	static constexpr uint64_t Encode(Snapshot s) noexcept {
		assert((s.seen & RESUMABLE_BIT) == 0);

		return s.seen | (s.resumable ? RESUMABLE_BIT : 0);
	}

	Snapshot Load() const noexcept {
		return Decode(value.load());
	}

	uint64_t GetSeen() const noexcept {
		return Load().seen;
	}

	bool IsResumable() const noexcept {
		return Load().resumable;
	}

	/**
	 * Account for bytes which are about to be forwarded to the
	 * consumer.
	 *
	 * @return the state before the update
	 */
	Snapshot AddSeen(uint64_t nbytes) noexcept {
		const Snapshot old = Decode(value.fetch_add(nbytes));
		assert(((old.seen + nbytes) & RESUMABLE_BIT) == 0);
		return old;
	}

	void SetResumable(bool resumable) noexcept {
		if (resumable)
			value.fetch_or(RESUMABLE_BIT);
		else
			value.fetch_and(~RESUMABLE_BIT);
	}

	/**
	 * Replace the state with the result of the given function
	 * (which may be called more than once).
	 *
	 * @return the state before the update
	 */
	template<typename F>
	Snapshot Update(F &&f) noexcept {
		uint64_t old = value.load();
		while (!value.compare_exchange_weak(old, Encode(f(Decode(old))))) {}
		return Decode(old);
	}
};

} // namespace S3
