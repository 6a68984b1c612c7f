// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef IPV4_ADDRESS_HXX
#define IPV4_ADDRESS_HXX

#include <cstdint>
#include <string>

#include <netinet/in.h>

/**
 * An OO wrapper for struct sockaddr_in.
 */
class IPv4Address {
	struct sockaddr_in address;

public:
	IPv4Address() = default;

	constexpr explicit IPv4Address(const struct sockaddr_in &_address) noexcept
		:address(_address) {}

	/**
	 * @param host_order_address the IPv4 address in host byte
	 * order
	 */
	IPv4Address(uint32_t host_order_address, uint16_t port) noexcept;

	/**
	 * Parse a dotted-quad address string.  Throws
	 * std::invalid_argument on error.
	 */
	static IPv4Address Parse(const char *s, uint16_t port);

	/**
	 * The "any" address (0.0.0.0).
	 */
	static IPv4Address Any(uint16_t port=0) noexcept {
		return IPv4Address(INADDR_ANY, port);
	}

	const struct sockaddr *GetAddress() const noexcept {
		return reinterpret_cast<const struct sockaddr *>(&address);
	}

	struct sockaddr *GetAddress() noexcept {
		return reinterpret_cast<struct sockaddr *>(&address);
	}

	static constexpr socklen_t GetSize() noexcept {
		return sizeof(struct sockaddr_in);
	}

	const struct in_addr &GetAddressIn() const noexcept {
		return address.sin_addr;
	}

	uint16_t GetPort() const noexcept {
		return ntohs(address.sin_port);
	}

	bool IsAny() const noexcept {
		return address.sin_addr.s_addr == htonl(INADDR_ANY);
	}

	/**
	 * Format only the address part (without the port).
	 */
	std::string ToString() const noexcept;
};

#endif
