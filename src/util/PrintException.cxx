// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "PrintException.hxx"

#include <stdio.h>

static void
PrintNested(const std::exception &e) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (...) {
		PrintException(std::current_exception());
	}
}

void
PrintException(const std::exception_ptr &ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		fprintf(stderr, "%s\n", e.what());
		PrintNested(e);
	} catch (const char *s) {
		fprintf(stderr, "%s\n", s);
	} catch (...) {
		fprintf(stderr, "Unrecognized exception\n");
	}
}
