// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "CharUtil.hxx"

/**
 * Skips whitespace at the beginning of the string, and returns the
 * first non-whitespace character.  If the string has no
 * non-whitespace characters, then a pointer to the NULL terminator
 * is returned.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
inline char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

/**
 * Strip trailing whitespace by null-terminating the string.
 */
[[gnu::nonnull]]
inline void
StripRight(char *p) noexcept
{
	char *end = p;
	while (*end != 0)
		++end;

	while (end > p && IsWhitespaceOrNull(end[-1]))
		--end;

	*end = 0;
}
