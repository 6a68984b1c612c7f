// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <new>
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
	 * Throws std::bad_alloc on error.
	 */
	CurlMulti()
		:handle(curl_multi_init())
	{
		if (handle == nullptr)
			throw std::bad_alloc();
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

	void Add(CURL *easy) {
		auto code = curl_multi_add_handle(handle, easy);
		if (code != CURLM_OK)
			throw CurlMultiError(code);
	}

	void Remove(CURL *easy) noexcept {
		curl_multi_remove_handle(handle, easy);
	}

	/**
	 * @return the number of transfers still running
	 */
	unsigned Perform() {
		int running_handles;
		auto code = curl_multi_perform(handle, &running_handles);
		if (code != CURLM_OK)
			throw CurlMultiError(code);
		return running_handles;
	}

	void Wait(std::chrono::milliseconds timeout) {
		auto code = curl_multi_wait(handle, nullptr, 0,
					    (int)timeout.count(), nullptr);
		if (code != CURLM_OK)
			throw CurlMultiError(code);
	}

	CURLMsg *InfoRead() noexcept {
		int msgs_in_queue;
		return curl_multi_info_read(handle, &msgs_in_queue);
	}
};
