// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_LISTEN_ADDRESS_HXX
#define DLNAQ_LISTEN_ADDRESS_HXX

#include <string>

/**
 * Determine the local address for the UPnP event listener.  The
 * environment variable "DLNA_LISTEN_IP" wins over the configured
 * value; without either, the address is detected automatically.
 *
 * @param configured the "listen_address" setting or nullptr
 */
std::string
GetListenAddress(const char *configured) noexcept;

#endif
