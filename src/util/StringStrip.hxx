// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Skips whitespace at the beginning of the string.
 */
[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

/**
 * Skips whitespace at the end of the string.
 */
[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;

/**
 * In-place variant for #Tokenizer: returns a pointer to the first
 * non-whitespace character.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
char *
StripLeft(char *p) noexcept;

/**
 * Skip whitespace at the beginning and terminate the string after
 * the last non-whitespace character.
 */
[[gnu::returns_nonnull]] [[gnu::nonnull]]
char *
Strip(char *p) noexcept;
