// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <curl/curl.h>

#include <stdexcept>

/**
 * An error reported by the CURL easy interface.
 */
class CurlError : public std::runtime_error {
	CURLcode code;

public:
	explicit CurlError(CURLcode _code)
		:std::runtime_error(curl_easy_strerror(_code)), code(_code) {}

	CurlError(CURLcode _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

/**
 * An error reported by the CURL multi interface.
 */
class CurlMultiError : public std::runtime_error {
	CURLMcode code;

public:
	explicit CurlMultiError(CURLMcode _code)
		:std::runtime_error(curl_multi_strerror(_code)), code(_code) {}

	CURLMcode GetCode() const noexcept {
		return code;
	}
};
