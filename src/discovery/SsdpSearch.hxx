// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SSDP_SEARCH_HXX
#define DLNAQ_SSDP_SEARCH_HXX

#include "MulticastSearch.hxx"

/**
 * #MulticastSearch implementation which sends an SSDP "M-SEARCH"
 * request for MediaRenderer devices to 239.255.255.250:1900 and
 * collects the "LOCATION" headers of all responses.
 */
class SsdpSearch final : public MulticastSearch {
public:
	std::vector<std::string> Search(std::chrono::steady_clock::duration timeout) noexcept override;
};

#endif
