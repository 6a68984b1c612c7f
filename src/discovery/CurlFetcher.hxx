// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CURL_FETCHER_HXX
#define DLNAQ_CURL_FETCHER_HXX

#include "HttpFetcher.hxx"
#include "lib/curl/Init.hxx"

/**
 * #HttpFetcher implementation using the libCURL "multi" interface.
 */
class CurlFetcher final : public HttpFetcher {
	ScopeCurlInit curl_init;

public:
	std::vector<FetchResult> FetchAll(const std::vector<std::string> &urls,
					  std::chrono::steady_clock::duration timeout) override;
};

#endif
