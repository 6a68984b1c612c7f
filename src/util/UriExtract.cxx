// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UriExtract.hxx"
#include "CharUtil.hxx"

static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return IsLowerAlphaASCII(ch);
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsLowerAlphaASCII(ch) || IsDigitASCII(ch) ||
		ch == '+' || ch == '.' || ch == '-';
}

[[gnu::pure]]
static bool
IsValidScheme(std::string_view p) noexcept
{
	if (p.empty() || !IsValidSchemeStart(p.front()))
		return false;

	for (std::size_t i = 1; i < p.size(); ++i)
		if (!IsValidSchemeChar(p[i]))
			return false;

	return true;
}

std::string_view
uri_get_scheme(std::string_view uri) noexcept
{
	const auto end = uri.find("://");
	if (end == std::string_view::npos)
		return {};

	const auto scheme = uri.substr(0, end);
	if (!IsValidScheme(scheme))
		return {};

	return scheme;
}

bool
uri_has_scheme(std::string_view uri) noexcept
{
	return !uri_get_scheme(uri).empty();
}

std::string_view
uri_get_origin(std::string_view uri) noexcept
{
	const auto scheme = uri_get_scheme(uri);
	if (scheme.empty())
		return {};

	const std::size_t authority = scheme.size() + 3;
	const auto end = uri.find_first_of("/?#", authority);
	if (end == std::string_view::npos)
		return uri;

	return uri.substr(0, end);
}
