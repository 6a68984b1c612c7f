// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Data.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdexcept>

template<typename F>
auto
ConfigData::With(ConfigOption option, F &&f) const
{
	const auto *param = GetParam(option);
	if (param == nullptr)
		return f(nullptr);

	try {
		return f(param->value.c_str());
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error on line {}",
						       param->line));
	}
}

void
ConfigData::Clear() noexcept
{
	for (auto &i : params)
		i.reset();
}

const char *
ConfigData::GetString(ConfigOption option,
		      const char *default_value) const noexcept
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->value.c_str()
		: default_value;
}

unsigned
ConfigData::GetUnsigned(ConfigOption option, unsigned default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr
			? ParseUnsigned(s)
			: default_value;
	});
}

unsigned
ConfigData::GetPort(ConfigOption option, unsigned default_value) const
{
	return With(option, [default_value](const char *s){
		if (s == nullptr)
			return default_value;

		const unsigned port = ParseUnsigned(s);
		if (port > 0xffff)
			throw std::runtime_error{"Not a valid port number"};

		return port;
	});
}

std::chrono::steady_clock::duration
ConfigData::GetDuration(ConfigOption option,
			std::chrono::steady_clock::duration min_value,
			std::chrono::steady_clock::duration default_value) const
{
	return With(option, [min_value, default_value](const char *s){
		if (s == nullptr)
			return default_value;

		const auto value = ParseDuration(s);
		if (value < min_value)
			throw std::runtime_error{"Value is too small"};

		return value;
	});
}
