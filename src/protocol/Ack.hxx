// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_ACK_HXX
#define DLNAQ_ACK_HXX

#include <stdexcept>
#include <utility>

enum ack {
	ACK_ERROR_ARG = 2,
	ACK_ERROR_UNKNOWN = 5,

	ACK_ERROR_NO_EXIST = 50,
	ACK_ERROR_SYSTEM = 52,
};

/**
 * An error which is reported to the client with the given "ACK" code.
 */
class ProtocolError : public std::runtime_error {
	enum ack code;

public:
	template<typename M>
	ProtocolError(enum ack _code, M &&msg) noexcept
		:std::runtime_error(std::forward<M>(msg)), code(_code) {}

	enum ack GetCode() const noexcept {
		return code;
	}
};

#endif
