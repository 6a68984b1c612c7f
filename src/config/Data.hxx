// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONFIG_DATA_HXX
#define DLNAQ_CONFIG_DATA_HXX

#include "Option.hxx"
#include "Param.hxx"

#include <array>
#include <chrono>
#include <optional>

/**
 * The settings loaded from the configuration file.  Each option is
 * set at most once; a later line overrides an earlier one.
 *
 * The getters throw if the value is malformed; the exception is
 * nested in one naming the line.
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	void Clear() noexcept;

	void SetParam(ConfigOption option, ConfigParam &&param) noexcept {
		params[std::size_t(option)] = std::move(param);
	}

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &p = params[std::size_t(option)];
		return p ? &*p : nullptr;
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	unsigned GetUnsigned(ConfigOption option,
			     unsigned default_value) const;

	/**
	 * Parse a TCP/UDP port number; 0 means "any".
	 */
	unsigned GetPort(ConfigOption option, unsigned default_value) const;

	/**
	 * Parse a duration given in seconds.
	 *
	 * Throws if the value is malformed or less than #min_value.
	 */
	std::chrono::steady_clock::duration
	GetDuration(ConfigOption option,
		    std::chrono::steady_clock::duration min_value,
		    std::chrono::steady_clock::duration default_value) const;

private:
	template<typename F>
	auto With(ConfigOption option, F &&f) const;
};

#endif
