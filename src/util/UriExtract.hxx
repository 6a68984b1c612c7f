// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Checks whether the specified URI has a scheme in the form
 * "scheme://".
 */
[[gnu::pure]]
bool
uri_has_scheme(std::string_view uri) noexcept;

/**
 * Returns the scheme name of the specified URI, or an empty string.
 */
[[gnu::pure]]
std::string_view
uri_get_scheme(std::string_view uri) noexcept;

/**
 * Returns the "origin" of an absolute URI: the scheme, the host and
 * the port, without the path (e.g. "http://10.0.0.5:8080").  Returns
 * an empty string if the URI has no scheme.
 */
[[gnu::pure]]
std::string_view
uri_get_origin(std::string_view uri) noexcept;
