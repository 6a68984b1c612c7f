// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CMDLINE_OPTION_PARSER_HXX
#define DLNAQ_CMDLINE_OPTION_PARSER_HXX

#include "OptionDef.hxx"

#include <span>

/**
 * Walks the command line, yielding one option at a time.  Arguments
 * which are not options are collected and can be obtained with
 * GetRemaining() after Next() has returned a false result.  A "--"
 * argument ends option processing.
 */
class OptionParser
{
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	const char **const remaining_head;
	const char **remaining_tail;

	bool options_done = false;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, char **_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1),
		 remaining_head(const_cast<const char **>(_argv + 1)),
		 remaining_tail(remaining_head) {}

	struct Result {
		/**
		 * Index into the #OptionDef array; -1 at the end of
		 * the command line.
		 */
		int index;

		/**
		 * The option's value, or nullptr if the option
		 * doesn't take one.
		 */
		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parse the next option.  Throws on unknown options and on
	 * missing values.
	 */
	Result Next();

	/**
	 * Returns the non-option arguments seen so far.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return {remaining_head, remaining_tail};
	}

private:
	const char *Shift() noexcept;
	const char *CheckShiftValue(const char *s, const OptionDef &option);
	Result IdentifyLongOption(const char *s);
	Result IdentifyShortOption(const char *s);
};

#endif
