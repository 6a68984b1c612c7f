// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_FAKE_DISCOVERY_HXX
#define DLNAQ_FAKE_DISCOVERY_HXX

#include "discovery/MulticastSearch.hxx"
#include "discovery/HttpFetcher.hxx"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * A #MulticastSearch which returns a scripted list of locations.
 */
class FakeSearch final : public MulticastSearch {
public:
	std::vector<std::string> locations;

	unsigned n_searches = 0;

	std::vector<std::string> Search(std::chrono::steady_clock::duration) noexcept override {
		++n_searches;
		return locations;
	}
};

/**
 * A #HttpFetcher which serves documents from a map.  Unknown URLs
 * fail like a "404".
 */
class FakeFetcher final : public HttpFetcher {
public:
	std::map<std::string, std::string, std::less<>> documents;

	/**
	 * All URLs which were requested, in order.
	 */
	std::vector<std::string> requests;

	unsigned n_calls = 0;

	std::vector<FetchResult> FetchAll(const std::vector<std::string> &urls,
					  std::chrono::steady_clock::duration) override {
		++n_calls;

		std::vector<FetchResult> results;
		results.reserve(urls.size());

		for (const auto &url : urls) {
			requests.push_back(url);

			FetchResult result;
			if (auto i = documents.find(url); i != documents.end())
				result.body = i->second;
			else
				result.error = std::make_exception_ptr(std::runtime_error("Got HTTP status 404"));
			results.emplace_back(std::move(result));
		}

		return results;
	}
};

#endif
