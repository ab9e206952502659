// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdlib.h>
#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw FmtRuntimeError("Unexpected tokens at end of line: {}",
				      p);
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextRelaxedUnquotedValue() noexcept
{
	char *result = p;
	while (!IsWhitespaceOrNull(front()))
		++p;

	if (!IsEnd()) {
		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = StripLeft(q);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextRelaxedValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	} else
		return NextRelaxedUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return NextRelaxedUnquotedValue();

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case '\\':
			case '\'':
			case '\"':
				*dest++ = ch;
				break;

			default:
				/* unsupported escape character */
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0 || strcmp(value, "true") == 0)
		return true;
	else if (strcmp(value, "no") == 0 || strcmp(value, "false") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Integer expected");

	char *endptr;
	unsigned long l = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0)
		throw Error("Failed to parse integer");

	if (l == 0)
		throw Error("Positive integer expected");

	if (l > 0xffffffffUL)
		throw Error("Integer too large");

	return l;
}

const char *
LineParser::ExpectWordAndSymbol(char symbol,
				const char *error1,
				const char *error2)
{
	if (!IsWordChar(front()))
		throw Error(error1);

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	}

	if (front() != symbol)
		throw Error(error2);

	*p++ = 0;
	Strip();
	return result;
}

char *
LineParser::ExpectValue()
{
	char *value = NextRelaxedValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}

bool
LineParser::ExpectBoolAndEnd()
{
	bool value = NextBool();
	ExpectEnd();
	return value;
}

unsigned
LineParser::ExpectPositiveIntegerAndEnd()
{
	unsigned value = NextPositiveInteger();
	ExpectEnd();
	return value;
}
