// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_REQUEST_HXX
#define DLNAQ_REQUEST_HXX

#include "protocol/ArgParser.hxx"

#include <cassert>
#include <span>

/**
 * The arguments of one command, without the command name.  The
 * argument count has already been checked against the command's
 * table entry.
 */
class Request {
	std::span<const char *const> args;

public:
	explicit constexpr Request(std::span<const char *const> _args) noexcept
		:args(_args) {}

	constexpr bool empty() const noexcept {
		return args.empty();
	}

	constexpr std::size_t size() const noexcept {
		return args.size();
	}

	constexpr const char *operator[](std::size_t i) const noexcept {
		return args[i];
	}

	/**
	 * The first argument of all per-renderer commands.
	 */
	constexpr const char *GetRendererName() const noexcept {
		assert(!empty());
		return args.front();
	}

	bool ParseForce(unsigned idx) const {
		assert(idx < size());
		return ParseCommandArgForce(args[idx]);
	}

	unsigned ParseVolume(unsigned idx) const {
		assert(idx < size());
		return ParseCommandArgVolume(args[idx]);
	}
};

#endif
