// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SSDP_HXX
#define DLNAQ_SSDP_HXX

#include <cstdint>
#include <string>
#include <string_view>

/**
 * 239.255.255.250 in host byte order.
 */
static constexpr uint32_t SSDP_MULTICAST_GROUP = 0xeffffffa;
static constexpr uint16_t SSDP_PORT = 1900;

static constexpr const char *MEDIA_RENDERER_DEVICE_TYPE =
	"urn:schemas-upnp-org:device:MediaRenderer:1";

/**
 * The "MX" header: the maximum number of seconds a device may delay
 * its response.
 */
static constexpr unsigned SSDP_MX = 3;

/**
 * The IP_MULTICAST_TTL of the search request.
 */
static constexpr unsigned char SSDP_MULTICAST_TTL = 4;

/**
 * Build the "M-SEARCH" request for the given search target.
 */
[[gnu::pure]]
std::string
BuildSsdpSearchRequest(std::string_view search_target) noexcept;

/**
 * Extract the value of the "LOCATION" header from a SSDP response
 * datagram.  The header name is matched case-insensitively at the
 * start of a line, and the value is stripped.
 *
 * @return the location or an empty string if there is none
 */
[[gnu::pure]]
std::string_view
ParseSsdpLocation(std::string_view datagram) noexcept;

#endif
