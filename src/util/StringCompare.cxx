// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringCompare.hxx"
#include "CharUtil.hxx"

#include <algorithm>

static constexpr bool
CharIsEqualIgnoreCase(char a, char b) noexcept
{
	return ToLowerASCII(a) == ToLowerASCII(b);
}

bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   CharIsEqualIgnoreCase);
}

bool
StringStartsWithIgnoreCase(std::string_view haystack,
			   std::string_view needle) noexcept
{
	return haystack.size() >= needle.size() &&
		StringIsEqualIgnoreCase(haystack.substr(0, needle.size()),
					needle);
}

bool
StringContainsIgnoreCase(std::string_view haystack,
			 std::string_view needle) noexcept
{
	return std::search(haystack.begin(), haystack.end(),
			   needle.begin(), needle.end(),
			   CharIsEqualIgnoreCase) != haystack.end() ||
		needle.empty();
}

std::string
ToLowerASCII(std::string_view s) noexcept
{
	std::string result;
	result.reserve(s.size());
	for (char ch : s)
		result.push_back(ToLowerASCII(ch));
	return result;
}
