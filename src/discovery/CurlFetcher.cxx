// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CurlFetcher.hxx"
#include "Domain.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Multi.hxx"
#include "lib/curl/HttpStatusError.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"
#include "config.h"

#include <fmt/format.h>

#include <list>

using std::chrono::milliseconds;

/**
 * Device descriptions are tiny; refuse anything larger than this.
 */
static constexpr std::size_t MAX_BODY_SIZE = 2 * 1024 * 1024;

namespace {

struct Transfer {
	const std::string &url;

	CurlEasy easy;

	FetchResult &result;

	bool too_large = false;

	Transfer(const std::string &_url, FetchResult &_result,
		 milliseconds timeout)
		:url(_url), easy(_url.c_str()), result(_result)
	{
		easy.SetPrivate(this);
		easy.SetUserAgent(PACKAGE "/" VERSION);
		easy.SetNoProgress();
		easy.SetNoSignal();
		easy.SetFollowLocation(5);
		easy.SetTimeout(timeout);
		easy.SetWriteFunction(WriteFunction, this);
	}

	Transfer(const Transfer &) = delete;
	Transfer &operator=(const Transfer &) = delete;

	void Done(CURLcode code) noexcept {
		if (too_large)
			result.error = std::make_exception_ptr(std::runtime_error("Response body is too large"));
		else if (code != CURLE_OK)
			result.error = std::make_exception_ptr(CurlError(code));
		else if (const long status = easy.GetResponseCode();
			 status != 200)
			result.error = std::make_exception_ptr(HttpStatusError(unsigned(status),
									       fmt::format("Got HTTP status {}", status)));

		if (result.error)
			result.body.clear();
	}

private:
	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *stream) noexcept {
		auto &t = *(Transfer *)stream;
		const std::size_t length = size * nmemb;
		if (t.result.body.size() + length > MAX_BODY_SIZE) {
			t.too_large = true;
			/* returning a short count aborts the transfer */
			return 0;
		}

		t.result.body.append(ptr, length);
		return length;
	}
};

} // anonymous namespace

std::vector<FetchResult>
CurlFetcher::FetchAll(const std::vector<std::string> &urls,
		      std::chrono::steady_clock::duration timeout)
{
	std::vector<FetchResult> results(urls.size());
	if (urls.empty())
		return results;

	const auto timeout_ms = std::chrono::ceil<milliseconds>(timeout);

	std::list<Transfer> transfers;
	CurlMulti multi;

	for (std::size_t i = 0; i < urls.size(); ++i) {
		try {
			transfers.emplace_back(urls[i], results[i], timeout_ms);
		} catch (...) {
			results[i].error = std::current_exception();
			continue;
		}

		try {
			multi.Add(transfers.back().easy.Get());
		} catch (...) {
			results[i].error = std::current_exception();
			transfers.pop_back();
		}
	}

	std::size_t pending = transfers.size();

	while (pending > 0) {
		const unsigned running = multi.Perform();

		while (CURLMsg *msg = multi.InfoRead()) {
			if (msg->msg != CURLMSG_DONE)
				continue;

			void *p;
			curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &p);
			auto &t = *(Transfer *)p;
			const CURLcode code = msg->data.result;
			multi.Remove(t.easy.Get());
			t.Done(code);
			--pending;

			if (!t.result.IsOk())
				FmtDebug(discovery_domain, "Failed to fetch {:?}: {}",
					 t.url, t.result.error);
		}

		if (running > 0)
			multi.Wait(milliseconds(1000));
	}

	return results;
}
