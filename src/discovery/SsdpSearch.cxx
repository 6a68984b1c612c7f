// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SsdpSearch.hxx"
#include "Ssdp.hxx"
#include "Domain.hxx"
#include "net/IPv4Address.hxx"
#include "net/SocketError.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

#include <algorithm>
#include <array>
#include <thread>

#include <netinet/in.h>
#include <sys/socket.h>

using std::chrono::milliseconds;

/**
 * The request is sent this many times to compensate for datagram
 * loss.
 */
static constexpr unsigned SEND_COUNT = 2;
static constexpr milliseconds SEND_INTERVAL{100};

/**
 * Upper bound for a single receive wait.
 */
static constexpr milliseconds MAX_RECEIVE_WAIT{1000};

static UniqueSocketDescriptor
CreateSearchSocket()
{
	UniqueSocketDescriptor s;
	if (!s.CreateNonBlock(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
		throw MakeSocketError("Failed to create socket");

	if (!s.SetMulticastTtl(SSDP_MULTICAST_TTL))
		throw MakeSocketError("Failed to set IP_MULTICAST_TTL");

	return s;
}

static void
SendSearchRequest(SocketDescriptor s)
{
	const auto request = BuildSsdpSearchRequest(MEDIA_RENDERER_DEVICE_TYPE);
	const std::span<const std::byte> data{
		reinterpret_cast<const std::byte *>(request.data()),
		request.size(),
	};
	const IPv4Address group(SSDP_MULTICAST_GROUP, SSDP_PORT);

	for (unsigned i = 0; i < SEND_COUNT; ++i) {
		if (i > 0)
			std::this_thread::sleep_for(SEND_INTERVAL);

		if (s.SendTo(data, group) < 0)
			throw MakeSocketError("Failed to send M-SEARCH");
	}
}

std::vector<std::string>
SsdpSearch::Search(std::chrono::steady_clock::duration timeout) noexcept
{
	const auto deadline = std::chrono::steady_clock::now() + timeout;

	std::vector<std::string> locations;

	UniqueSocketDescriptor s;
	try {
		s = CreateSearchSocket();
		SendSearchRequest(s);
	} catch (...) {
		FmtWarning(ssdp_domain, "SSDP search failed: {}",
			   std::current_exception());
		return locations;
	}

	std::array<std::byte, 4096> buffer;

	while (true) {
		const auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
			break;

		const auto remaining =
			std::chrono::ceil<milliseconds>(deadline - now);
		const int ready = s.WaitReadable(std::min(remaining,
							   MAX_RECEIVE_WAIT));
		if (ready < 0) {
			FmtWarning(ssdp_domain, "SSDP receive failed: {}",
				   std::make_exception_ptr(MakeSocketError("poll() failed")));
			break;
		}

		if (ready == 0)
			continue;

		const auto nbytes = s.Receive(buffer);
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (IsSocketErrorReceiveWouldBlock(e))
				continue;

			FmtWarning(ssdp_domain, "SSDP receive failed: {}",
				   std::make_exception_ptr(MakeSocketError(e, "recv() failed")));
			break;
		}

		const std::string_view datagram{
			reinterpret_cast<const char *>(buffer.data()),
			std::size_t(nbytes),
		};

		const auto location = ParseSsdpLocation(datagram);
		if (location.empty())
			continue;

		if (std::find(locations.begin(), locations.end(),
			      location) != locations.end())
			continue;

		FmtDebug(ssdp_domain, "Found {:?}", location);
		locations.emplace_back(location);
	}

	return locations;
}
