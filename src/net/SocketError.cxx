// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketError.hxx"

std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code,
						 std::system_category()),
				 msg);
}
