// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_COMPARE_HXX
#define STRING_COMPARE_HXX

#include <string>
#include <string_view>

/**
 * Compare two strings, ignoring the case of ASCII letters.
 */
[[gnu::pure]]
bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept;

[[gnu::pure]]
bool
StringStartsWithIgnoreCase(std::string_view haystack,
			   std::string_view needle) noexcept;

/**
 * Does the haystack contain the needle anywhere, ignoring the case
 * of ASCII letters?  An empty needle is always found.
 */
[[gnu::pure]]
bool
StringContainsIgnoreCase(std::string_view haystack,
			 std::string_view needle) noexcept;

/**
 * Returns the portion of the string after a prefix, or nullptr if
 * the string does not begin with it.
 */
[[gnu::pure]] [[gnu::nonnull]]
static inline const char *
StringAfterPrefix(const char *haystack, std::string_view needle) noexcept
{
	return std::string_view{haystack}.starts_with(needle)
		? haystack + needle.size()
		: nullptr;
}

std::string
ToLowerASCII(std::string_view s) noexcept;

#endif
