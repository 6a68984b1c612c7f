// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <new>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::bad_alloc on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::bad_alloc();
	}

	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	void SetPrivate(void *pointer) {
		SetOption(CURLOPT_PRIVATE, pointer);
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetNoProgress(bool value=true) {
		SetOption(CURLOPT_NOPROGRESS, (long)value);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	void SetFollowLocation(long max_redirs) {
		SetOption(CURLOPT_FOLLOWLOCATION, 1L);
		SetOption(CURLOPT_MAXREDIRS, max_redirs);
	}

	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, (long)timeout.count());
	}

	void SetWriteFunction(std::size_t (*function)(char *, std::size_t,
						      std::size_t, void *),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	template<typename T>
	bool GetInfo(CURLINFO info, T value_r) const noexcept {
		return ::curl_easy_getinfo(handle, info, value_r) == CURLE_OK;
	}

	/**
	 * Returns the response body's size, or -1 if that is unknown.
	 */
	[[gnu::pure]]
	long GetResponseCode() const noexcept {
		long status;
		return GetInfo(CURLINFO_RESPONSE_CODE, &status)
			? status
			: -1;
	}
};
