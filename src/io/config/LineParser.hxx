// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <stdexcept>

class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p))
	{
		StripRight(p);
	}

	void Strip() noexcept {
		p = StripLeft(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	/**
	 * Throws #Error if there is anything left on this line.
	 */
	void ExpectEnd();

	bool SkipSymbol(char symbol) {
		bool found = front() == symbol;
		if (found)
			++p;
		return found;
	}

	char *NextValue() noexcept;
	char *NextRelaxedValue() noexcept;
	char *NextUnescape() noexcept;

	/**
	 * Parse "yes"/"true" or "no"/"false".
	 */
	bool NextBool();
	bool ExpectBoolAndEnd();

	unsigned NextPositiveInteger();
	unsigned ExpectPositiveIntegerAndEnd();

	const char *ExpectWordAndSymbol(char symbol,
					const char *error1,
					const char *error2);

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	static constexpr bool IsWordChar(char ch) {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextRelaxedUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
