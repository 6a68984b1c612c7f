// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <stdexcept>
#include <string>

/**
 * The HTTP server replied with a status other than "200 OK".
 */
class HttpStatusError : public std::runtime_error {
	unsigned status;

public:
	HttpStatusError(unsigned _status, const std::string &msg)
		:std::runtime_error(msg), status(_status) {}

	unsigned GetStatus() const noexcept {
		return status;
	}
};
