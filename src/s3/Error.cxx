// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"
#include "lib/fmt/HttpStatusFormatter.hxx"

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

namespace S3 {

ObjectError
MakeNotFoundError(std::string_view path)
{
	return {ObjectErrorCode::NOT_FOUND, path, HttpStatus::NOT_FOUND,
		fmt::format("Object not found: {}"sv, path)};
}

ObjectError
MakeAccessDeniedError(std::string_view path)
{
	return {ObjectErrorCode::ACCESS_DENIED, path, HttpStatus::FORBIDDEN,
		fmt::format("Access denied: {}"sv, path)};
}

ObjectError
MakeUnexpectedStatusError(std::string_view path, HttpStatus status)
{
	const char *text = http_status_to_string(status);

	return {ObjectErrorCode::UNEXPECTED_STATUS, path, status,
		text != nullptr
		? fmt::format("Unexpected status \"{}\" for {}"sv, text, path)
		: fmt::format("Unexpected status {} for {}"sv, status, path)};
}

ObjectError
MakeConnectionFailedError(std::string_view path,
			  std::string_view detail)
{
	return {ObjectErrorCode::CONNECTION_FAILED, path,
		HttpStatus::UNDEFINED,
		fmt::format("Connection failed while reading {}: {}"sv,
			    path, detail)};
}

std::exception_ptr
NestConnectionFailedError(std::string_view path,
			  std::string_view detail) noexcept
{
	try {
		std::throw_with_nested(MakeConnectionFailedError(path, detail));
	} catch (...) {
		return std::current_exception();
	}
}

} // namespace S3
