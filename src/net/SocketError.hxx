// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef SOCKET_ERROR_HXX
#define SOCKET_ERROR_HXX

#include <cerrno>
#include <system_error>

typedef int socket_error_t;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

constexpr bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK || code == EINTR;
}

[[gnu::const]]
std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept;

[[gnu::pure]]
static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}

#endif
