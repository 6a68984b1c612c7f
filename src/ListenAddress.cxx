// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ListenAddress.hxx"
#include "net/LocalAddress.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <stdlib.h>

static constexpr Domain listen_domain("listen");

std::string
GetListenAddress(const char *configured) noexcept
{
	if (const char *env = getenv("DLNA_LISTEN_IP");
	    env != nullptr && *env != 0) {
		FmtDebug(listen_domain, "Using DLNA_LISTEN_IP={}", env);
		return env;
	}

	if (configured != nullptr && *configured != 0)
		return configured;

	auto address = DetectLocalAddress();
	FmtDebug(listen_domain, "Detected local address {}", address);
	return address;
}
