// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "DiscoveryEngine.hxx"
#include "DeviceParser.hxx"
#include "ScpdParser.hxx"
#include "MulticastSearch.hxx"
#include "HttpFetcher.hxx"
#include "Domain.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/StringCompare.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <cstdint>

std::shared_ptr<const RendererList>
DiscoveryEngine::GetFreshCache() const noexcept
{
	const std::scoped_lock lock{cache_mutex};
	if (cache == nullptr ||
	    std::chrono::steady_clock::now() - cache_time >= config.cache_ttl)
		return nullptr;

	return cache;
}

std::shared_ptr<const RendererList>
DiscoveryEngine::Discover(bool force)
{
	const std::scoped_lock discover_lock{discover_mutex};

	if (!force) {
		/* checked under the lock: concurrent callers share
		   one pass */
		if (auto fresh = GetFreshCache())
			return fresh;
	}

	auto list = std::make_shared<const RendererList>(RunPass());

	const std::scoped_lock cache_lock{cache_mutex};
	cache = list;
	cache_time = std::chrono::steady_clock::now();
	return list;
}

std::optional<RendererRecord>
DiscoveryEngine::Resolve(std::string_view name)
{
	const auto list = Discover(false);
	const auto *r = FindRenderer(*list, name);
	if (r == nullptr)
		return std::nullopt;

	return *r;
}

/**
 * Fetch all URLs and log the setup failure instead of propagating
 * it; discovery must never fail as a whole.
 */
static std::vector<FetchResult>
FetchAllOrNothing(HttpFetcher &fetcher, const std::vector<std::string> &urls,
		  std::chrono::steady_clock::duration timeout) noexcept
try {
	return fetcher.FetchAll(urls, timeout);
} catch (...) {
	FmtError(discovery_domain, "HTTP fetch failed: {}",
		 std::current_exception());

	std::vector<FetchResult> results(urls.size());
	for (auto &i : results)
		i.error = std::current_exception();
	return results;
}

/**
 * Inspect the action list of the AVTransport SCPD.  Errors mean "no
 * gapless support".
 */
static bool
SupportsGaplessPreload(const FetchResult &scpd, std::string_view url) noexcept
{
	if (!scpd.IsOk()) {
		FmtDebug(discovery_domain, "Failed to fetch SCPD {:?}: {}",
			 url, scpd.error);
		return false;
	}

	try {
		return ParseScpdActions(scpd.body).contains(SET_NEXT_AV_TRANSPORT_URI);
	} catch (...) {
		FmtDebug(discovery_domain, "Failed to parse SCPD {:?}: {}",
			 url, std::current_exception());
		return false;
	}
}

RendererList
DiscoveryEngine::RunPass()
{
	LogInfo(discovery_domain, "Searching for renderers");

	const auto locations = search.Search(config.search_timeout);
	FmtInfo(discovery_domain, "Multicast search found {} location(s)",
		locations.size());

	const auto descriptions =
		FetchAllOrNothing(fetcher, locations, config.http_timeout);

	std::vector<UPnPDevice> devices;
	std::vector<std::string> device_locations;

	for (std::size_t i = 0; i < locations.size(); ++i) {
		const auto &location = locations[i];
		const auto &description = descriptions[i];

		if (!description.IsOk()) {
			FmtDebug(discovery_domain, "Failed to fetch {:?}: {}",
				 location, description.error);
			continue;
		}

		try {
			devices.emplace_back(ParseDeviceDescription(description.body,
								    location));
			device_locations.emplace_back(location);
		} catch (...) {
			FmtDebug(discovery_domain, "Failed to parse {:?}: {}",
				 location, std::current_exception());
		}
	}

	/* all SCPD requests are issued together; devices without an
	   AVTransport SCPD URL get an empty slot */
	std::vector<std::string> scpd_urls;
	std::vector<std::size_t> scpd_index(devices.size(), SIZE_MAX);
	for (std::size_t i = 0; i < devices.size(); ++i) {
		const auto *av_transport =
			devices[i].FindService(AV_TRANSPORT_SERVICE_TYPE);
		if (av_transport == nullptr || av_transport->scpd_url.empty())
			continue;

		scpd_index[i] = scpd_urls.size();
		scpd_urls.push_back(av_transport->scpd_url);
	}

	const auto scpds =
		FetchAllOrNothing(fetcher, scpd_urls, config.http_timeout);

	RendererList result;

	for (std::size_t i = 0; i < devices.size(); ++i) {
		const auto &device = devices[i];

		const bool gapless = scpd_index[i] != SIZE_MAX &&
			SupportsGaplessPreload(scpds[scpd_index[i]],
					       scpd_urls[scpd_index[i]]);

		auto r = MakeRendererRecord(device, device_locations[i], gapless);
		if (!r) {
			FmtDebug(discovery_domain,
				 "Ignoring {:?}: no AVTransport control URL",
				 device_locations[i]);
			continue;
		}

		FmtInfo(discovery_domain, "Found renderer {:?} ({}) gapless={}",
			r->name, r->identity, r->supports_gapless_preload);
		result.emplace_back(std::move(*r));
	}

	FmtNotice(discovery_domain, "Discovered {} renderer(s)", result.size());
	return result;
}

const RendererRecord *
FindRenderer(const RendererList &list, std::string_view name) noexcept
{
	for (const auto &i : list)
		if (StringIsEqualIgnoreCase(i.name, name))
			return &i;

	for (const auto &i : list)
		if (StringContainsIgnoreCase(i.name, name))
			return &i;

	return nullptr;
}
