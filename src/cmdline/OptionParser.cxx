// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringCompare.hxx"

inline const char *
OptionParser::Shift() noexcept
{
	const char *value = args.front();
	args = args.subspan(1);
	return value;
}

inline const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", s);

	return Shift();
}

inline OptionParser::Result
OptionParser::IdentifyLongOption(const char *s)
{
	for (const auto &i : options) {
		if (!i.HasLongOption())
			continue;

		const char *t = StringAfterPrefix(s + 2, i.GetLongOption());
		if (t == nullptr)
			continue;

		const char *value;
		if (*t == 0)
			value = CheckShiftValue(s, i);
		else if (*t == '=' && i.HasValue())
			value = t + 1;
		else
			continue;

		return {int(&i - options.data()), value};
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

inline OptionParser::Result
OptionParser::IdentifyShortOption(const char *s)
{
	if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options)
			if (i.HasShortOption() && ch == i.GetShortOption())
				return {int(&i - options.data()),
					CheckShiftValue(s, i)};
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift();

		if (!options_done && arg[0] == '-' && arg[1] != 0) {
			if (arg[1] != '-')
				return IdentifyShortOption(arg);

			if (arg[2] == 0) {
				options_done = true;
				continue;
			}

			return IdentifyLongOption(arg);
		}

		*remaining_tail++ = arg;
	}

	return {-1, nullptr};
}
