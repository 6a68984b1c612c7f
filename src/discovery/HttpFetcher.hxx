// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_HTTP_FETCHER_HXX
#define DLNAQ_HTTP_FETCHER_HXX

#include <chrono>
#include <exception>
#include <string>
#include <vector>

/**
 * The outcome of one HTTP GET: either the response body or the error
 * which made the request fail.
 */
struct FetchResult {
	std::string body;

	std::exception_ptr error;

	bool IsOk() const noexcept {
		return !error;
	}
};

/**
 * Fetches documents over HTTP.
 */
class HttpFetcher {
public:
	virtual ~HttpFetcher() noexcept = default;

	/**
	 * Fetch all given URLs concurrently.  Failures (transport
	 * errors, timeouts, a status other than 200) are reported per
	 * URL in the result; this method itself throws only if the
	 * transfers could not be set up at all.
	 *
	 * @param timeout the maximum duration of each request
	 * @return one result per URL, in the same order
	 */
	virtual std::vector<FetchResult> FetchAll(const std::vector<std::string> &urls,
						  std::chrono::steady_clock::duration timeout) = 0;
};

#endif
