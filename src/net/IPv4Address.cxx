// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "IPv4Address.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <arpa/inet.h>

IPv4Address::IPv4Address(uint32_t host_order_address, uint16_t port) noexcept
	:address{}
{
	address.sin_family = AF_INET;
	address.sin_port = htons(port);
	address.sin_addr.s_addr = htonl(host_order_address);
}

IPv4Address
IPv4Address::Parse(const char *s, uint16_t port)
{
	IPv4Address result = Any(port);
	if (inet_pton(AF_INET, s, &result.address.sin_addr) != 1)
		throw FmtInvalidArgument("Not a valid IPv4 address: {:?}", s);

	return result;
}

std::string
IPv4Address::ToString() const noexcept
{
	char buffer[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &address.sin_addr,
		      buffer, sizeof(buffer)) == nullptr)
		return {};

	return buffer;
}
