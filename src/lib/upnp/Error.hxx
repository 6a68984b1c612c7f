// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_UPNP_ERROR_HXX
#define DLNAQ_UPNP_ERROR_HXX

#include <upnp/upnptools.h>

#include <fmt/core.h>

#include <stdexcept>

/**
 * A libupnp call has failed.  The code is one of the UPNP_E_* values
 * or, for a SOAP fault, the UPnP error code sent by the device.
 */
class UpnpError : public std::runtime_error {
	int code;

public:
	UpnpError(int _code, const char *msg)
		:std::runtime_error(fmt::format("{}: {}", msg,
						UpnpGetErrorMessage(_code))),
		 code(_code) {}

	int GetCode() const noexcept {
		return code;
	}
};

#endif
