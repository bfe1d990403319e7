// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"

template<typename T>
static void
AppendNestedMessage(std::string &result, T &&e,
		    std::string_view fallback, std::string_view separator) noexcept
{
	try {
		std::rethrow_if_nested(std::forward<T>(e));
	} catch (...) {
		result += separator;
		result += GetFullMessage(std::current_exception(),
					 fallback, separator);
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       std::string_view fallback, std::string_view separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string result{e.what()};
		AppendNestedMessage(result, e, fallback, separator);
		return result;
	} catch (const std::nested_exception &ne) {
		std::string result{fallback};
		AppendNestedMessage(result, ne, fallback, separator);
		return result;
	} catch (const char *s) {
		return s;
	} catch (...) {
	}

	return std::string{fallback};
}
