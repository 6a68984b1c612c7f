// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_MULTICAST_SEARCH_HXX
#define DLNAQ_MULTICAST_SEARCH_HXX

#include <chrono>
#include <string>
#include <vector>

/**
 * Collects the device description URLs of renderers which answer a
 * multicast search.
 */
class MulticastSearch {
public:
	virtual ~MulticastSearch() noexcept = default;

	/**
	 * Search the local network.  This is best-effort: it never
	 * throws and never blocks longer than the given timeout;
	 * renderers which do not answer are silently missing from
	 * the result.
	 *
	 * @return a list of unique description URLs in the order
	 * they were received
	 */
	virtual std::vector<std::string> Search(std::chrono::steady_clock::duration timeout) noexcept = 0;
};

#endif
