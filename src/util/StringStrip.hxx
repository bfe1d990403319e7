// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Skips whitespace at the beginning of the string, and returns the
 * first non-whitespace character.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
char *
StripLeft(char *p) noexcept;

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

/**
 * Null-terminate the string, discarding whitespace at the end.
 */
[[gnu::nonnull]]
void
StripRight(char *p) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;
