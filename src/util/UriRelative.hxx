// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string>
#include <string_view>

/**
 * Resolve a URI found in a device description against the origin
 * (scheme+host+port) it was fetched from.  Absolute URIs are returned
 * as-is; a relative path lacking a leading slash gets one inserted.
 * An empty URI stays empty.
 */
[[gnu::pure]]
std::string
uri_apply_origin(std::string_view uri, std::string_view origin) noexcept;
