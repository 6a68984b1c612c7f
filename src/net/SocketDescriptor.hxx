// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef SOCKET_DESCRIPTOR_HXX
#define SOCKET_DESCRIPTOR_HXX

#include <chrono>
#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

class IPv4Address;

/**
 * An OO wrapper for a Berkeley socket descriptor.  This class does
 * not own the descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
protected:
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	/**
	 * Create a socket with close-on-exec enabled.
	 *
	 * @return true on success; errno is set on failure
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept {
		return Create(domain, type | SOCK_NONBLOCK_FLAG, protocol);
	}

	void Close() noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetIntOption(int level, int name, const int &value) const noexcept {
		return SetOption(level, name, &value, sizeof(value));
	}

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		return SetIntOption(level, name, value);
	}

	/**
	 * Set the IP_MULTICAST_TTL option.
	 */
	bool SetMulticastTtl(unsigned char ttl) const noexcept;

	/**
	 * Connect a datagram socket; this sends nothing, it only
	 * selects the route (and thus the local address).
	 */
	bool Connect(const IPv4Address &address) const noexcept;

	/**
	 * Obtain the local address this socket is bound to.  Returns
	 * the "any" address on error.
	 */
	[[gnu::pure]]
	IPv4Address GetLocalAddress() const noexcept;

	/**
	 * @return the number of bytes sent or -1 on error
	 */
	ssize_t SendTo(std::span<const std::byte> src,
		       const IPv4Address &address) const noexcept;

	/**
	 * @return the number of bytes received or -1 on error
	 */
	ssize_t Receive(std::span<std::byte> dest) const noexcept;

	/**
	 * Wait until the socket becomes readable.
	 *
	 * @return 1 if readable, 0 on timeout, -1 on error
	 */
	int WaitReadable(std::chrono::milliseconds timeout) const noexcept;

private:
#ifdef SOCK_NONBLOCK
	static constexpr int SOCK_NONBLOCK_FLAG = SOCK_NONBLOCK;
#else
	static constexpr int SOCK_NONBLOCK_FLAG = 0;
#endif
};

#endif
