// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_DISCOVERY_ENGINE_HXX
#define DLNAQ_DISCOVERY_ENGINE_HXX

#include "Renderer.hxx"
#include "thread/Mutex.hxx"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

class MulticastSearch;
class HttpFetcher;

using RendererList = std::vector<RendererRecord>;

struct DiscoveryConfig {
	/**
	 * How long to collect multicast search responses.
	 */
	std::chrono::steady_clock::duration search_timeout = std::chrono::seconds(4);

	/**
	 * A discovery result older than this is stale.
	 */
	std::chrono::steady_clock::duration cache_ttl = std::chrono::seconds(300);

	/**
	 * Timeout for each description and SCPD request.
	 */
	std::chrono::steady_clock::duration http_timeout = std::chrono::seconds(5);
};

/**
 * Finds media renderers on the local network and caches the result.
 *
 * This class is thread-safe.  Concurrent discovery passes are
 * serialized; readers always see either the old or the new list,
 * never a mix.
 */
class DiscoveryEngine {
	MulticastSearch &search;
	HttpFetcher &fetcher;

	const DiscoveryConfig config;

	/**
	 * Held for the duration of a discovery pass.
	 */
	Mutex discover_mutex;

	/**
	 * Protects #cache and #cache_time.
	 */
	mutable Mutex cache_mutex;

	std::shared_ptr<const RendererList> cache;

	std::chrono::steady_clock::time_point cache_time;

public:
	DiscoveryEngine(MulticastSearch &_search, HttpFetcher &_fetcher,
			const DiscoveryConfig &_config) noexcept
		:search(_search), fetcher(_fetcher), config(_config) {}

	DiscoveryEngine(const DiscoveryEngine &) = delete;
	DiscoveryEngine &operator=(const DiscoveryEngine &) = delete;

	/**
	 * Return the list of renderers.  Unless #force is set, a
	 * cached list which is younger than the configured TTL is
	 * returned without any network activity.
	 *
	 * Per-device errors are logged and never propagated; this
	 * method returns an empty list if nothing was found.
	 */
	std::shared_ptr<const RendererList> Discover(bool force=false);

	/**
	 * Look up a renderer by its name, using the cache if it is
	 * fresh.  See FindRenderer() for the matching rules.
	 */
	std::optional<RendererRecord> Resolve(std::string_view name);

private:
	std::shared_ptr<const RendererList> GetFreshCache() const noexcept;

	RendererList RunPass();
};

/**
 * Find a renderer by name, ignoring case.  An exact match wins over a
 * substring match; among several substring matches, the first one in
 * the list wins.
 *
 * @return a pointer into the list or nullptr if nothing matches
 */
[[gnu::pure]]
const RendererRecord *
FindRenderer(const RendererList &list, std::string_view name) noexcept;

#endif
