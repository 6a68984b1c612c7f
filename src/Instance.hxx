// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_INSTANCE_HXX
#define DLNAQ_INSTANCE_HXX

#include "discovery/SsdpSearch.hxx"
#include "discovery/CurlFetcher.hxx"
#include "discovery/DiscoveryEngine.hxx"
#include "lib/upnp/ControlPoint.hxx"
#include "session/Registry.hxx"

#include <string>

/**
 * The daemon's long-lived objects, declared in dependency order.
 */
struct Instance final {
	SsdpSearch search;

	CurlFetcher fetcher;

	DiscoveryEngine discovery;

	UpnpControlPoint control_point;

	/**
	 * Declared last so it is destroyed first: stopping the
	 * sessions needs the #control_point.
	 */
	SessionRegistry sessions;

	Instance(const DiscoveryConfig &discovery_config,
		 const std::string &listen_address, unsigned listen_port);

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;
};

#endif
