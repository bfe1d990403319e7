// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Easy.hxx"

#include <curl/curl.h>

#include <chrono>
#include <stdexcept>
#include <utility>

/**
 * An OO wrapper for a "CURLM*" (a libCURL "multi" handle).
 */
class CurlMulti {
	CURLM *handle = nullptr;

public:
	/**
	 * Allocate a new CURLM*.
	 *
	 * Throws std::runtime_error on error.
	 */
	CurlMulti()
		:handle(curl_multi_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_multi_init() failed");
	}

	CurlMulti(CurlMulti &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlMulti() noexcept {
		if (handle != nullptr)
			curl_multi_cleanup(handle);
	}

	CurlMulti &operator=(CurlMulti &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURLM *Get() noexcept {
		return handle;
	}

	void Add(CurlEasy &easy) {
		auto code = curl_multi_add_handle(handle, easy.Get());
		if (code != CURLM_OK)
			throw std::runtime_error(curl_multi_strerror(code));
	}

	void Remove(CurlEasy &easy) noexcept {
		curl_multi_remove_handle(handle, easy.Get());
	}

	/**
	 * Perform pending transfers without blocking.
	 *
	 * @return the number of transfers which are still running
	 */
	unsigned Perform() {
		int running_handles;
		auto code = curl_multi_perform(handle, &running_handles);
		if (code != CURLM_OK)
			throw std::runtime_error(curl_multi_strerror(code));

		return running_handles;
	}

	/**
	 * Wait until there is activity on one of the transfers'
	 * sockets or until the timeout expires.
	 */
	void Poll(std::chrono::milliseconds timeout) {
		auto code = curl_multi_poll(handle, nullptr, 0,
					    timeout.count(), nullptr);
		if (code != CURLM_OK)
			throw std::runtime_error(curl_multi_strerror(code));
	}

	CURLMsg *InfoRead() noexcept {
		int msgs_in_queue;
		return curl_multi_info_read(handle, &msgs_in_queue);
	}
};
