// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LocalAddress.hxx"
#include "IPv4Address.hxx"
#include "UniqueSocketDescriptor.hxx"
#include "discovery/Ssdp.hxx"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>

std::string
DetectLocalAddress() noexcept
{
	UniqueSocketDescriptor s;
	if (!s.Create(AF_INET, SOCK_DGRAM, 0))
		return "0.0.0.0";

	if (!s.Connect(IPv4Address(SSDP_MULTICAST_GROUP, SSDP_PORT)))
		return "0.0.0.0";

	const auto local = s.GetLocalAddress();
	if (local.IsAny())
		return "0.0.0.0";

	return local.ToString();
}

std::string
FindInterfaceByAddress(const char *address) noexcept
{
	struct in_addr wanted;
	if (inet_pton(AF_INET, address, &wanted) != 1)
		return {};

	struct ifaddrs *list;
	if (getifaddrs(&list) < 0)
		return {};

	std::string result;
	for (const struct ifaddrs *i = list; i != nullptr; i = i->ifa_next) {
		if (i->ifa_addr == nullptr || i->ifa_addr->sa_family != AF_INET)
			continue;

		const auto &sin = *(const struct sockaddr_in *)i->ifa_addr;
		if (sin.sin_addr.s_addr == wanted.s_addr) {
			result = i->ifa_name;
			break;
		}
	}

	freeifaddrs(list);
	return result;
}
