// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UriRelative.hxx"
#include "UriExtract.hxx"

std::string
uri_apply_origin(std::string_view uri, std::string_view origin) noexcept
{
	if (uri.empty() || uri_has_scheme(uri))
		return std::string{uri};

	std::string result{origin};
	if (!result.empty() && result.back() == '/')
		result.pop_back();

	if (uri.front() != '/')
		result.push_back('/');

	result.append(uri);
	return result;
}
