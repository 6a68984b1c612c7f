// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_NET_LOCAL_ADDRESS_HXX
#define DLNAQ_NET_LOCAL_ADDRESS_HXX

#include <string>

/**
 * Determine the local IPv4 address which routes toward the SSDP
 * multicast group.  This performs a "connect" on a datagram socket,
 * which sends nothing.
 *
 * @return the dotted-quad address, or "0.0.0.0" if detection fails
 */
std::string
DetectLocalAddress() noexcept;

/**
 * Find the name of the network interface which has the given IPv4
 * address assigned.
 *
 * @return the interface name, or an empty string if none matches
 */
std::string
FindInterfaceByAddress(const char *address) noexcept;

#endif
