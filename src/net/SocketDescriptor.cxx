// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketDescriptor.hxx"
#include "IPv4Address.hxx"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
#ifdef SOCK_CLOEXEC
	/* implemented since Linux 2.6.27 */
	type |= SOCK_CLOEXEC;
#endif

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	fd = new_fd;
	return true;
}

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		::close(std::exchange(fd, -1));
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetMulticastTtl(unsigned char ttl) const noexcept
{
	return SetOption(IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
}

bool
SocketDescriptor::Connect(const IPv4Address &address) const noexcept
{
	return ::connect(fd, address.GetAddress(), address.GetSize()) >= 0;
}

IPv4Address
SocketDescriptor::GetLocalAddress() const noexcept
{
	IPv4Address address = IPv4Address::Any();
	socklen_t size = address.GetSize();
	if (getsockname(fd, address.GetAddress(), &size) < 0)
		return IPv4Address::Any();

	return address;
}

ssize_t
SocketDescriptor::SendTo(std::span<const std::byte> src,
			 const IPv4Address &address) const noexcept
{
	return ::sendto(fd, src.data(), src.size(), MSG_NOSIGNAL,
			address.GetAddress(), address.GetSize());
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), MSG_DONTWAIT);
}

int
SocketDescriptor::WaitReadable(std::chrono::milliseconds timeout) const noexcept
{
	struct pollfd pfd{fd, POLLIN, 0};
	int result = ::poll(&pfd, 1, int(timeout.count()));
	if (result > 0 && (pfd.revents & (POLLERR|POLLNVAL)) != 0)
		return -1;

	return result > 0 ? 1 : result;
}
