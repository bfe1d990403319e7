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
		throw FmtRuntimeError("Unexpected tokens at end of line: {}", p);
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd()) {
		/* garbage after the word; let the caller see it */
		return nullptr;
	}

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (!IsEnd()) {
		if (!IsWhitespaceNotNull(front()))
			return nullptr;

		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
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
LineParser::NextUnescape() noexcept
{
	if (!IsQuote(front()))
		return nullptr;

	const char stop = *p++;
	char *dest = p, *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;

		if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		}

		if (ch == '\\') {
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
			case '"':
				*dest++ = ch;
				break;

			default:
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

unsigned
LineParser::NextUnsigned()
{
	if (!IsDigitASCII(front()))
		throw Error("Number expected");

	char *endptr;
	const unsigned long l = strtoul(p, &endptr, 10);
	if (endptr == p || l > 0xffffffffUL)
		throw Error("Number out of range");

	p = endptr;
	Strip();
	return (unsigned)l;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
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
