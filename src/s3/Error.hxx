// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "http/Status.hxx"

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace S3 {

enum class ObjectErrorCode : uint_least8_t {
	/**
	 * The object does not exist (HTTP 404).
	 */
	NOT_FOUND,

	/**
	 * The credentials do not permit reading the object (HTTP
	 * 403).
	 */
	ACCESS_DENIED,

	/**
	 * The server responded with a status we cannot handle; see
	 * ObjectError::GetStatus().
	 */
	UNEXPECTED_STATUS,

	/**
	 * The transfer failed after the response headers had been
	 * received; parts of the object may already have been
	 * delivered.  The cause (if any) is attached as nested
	 * exception.
	 */
	CONNECTION_FAILED,
};

/**
 * A terminal error while fetching an object.
 */
class ObjectError : public std::runtime_error {
	std::string path;

	HttpStatus status;

	ObjectErrorCode code;

public:
	ObjectError(ObjectErrorCode _code, std::string_view _path,
		    HttpStatus _status, const std::string &_msg)
		:std::runtime_error(_msg), path(_path),
		 status(_status), code(_code) {}

	ObjectErrorCode GetCode() const noexcept {
		return code;
	}

	/**
	 * The logical path of the object which was requested.
	 */
	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * The HTTP status which caused this error, or
	 * HttpStatus::UNDEFINED for #CONNECTION_FAILED.
	 */
	HttpStatus GetStatus() const noexcept {
		return status;
	}
};

ObjectError
MakeNotFoundError(std::string_view path);

ObjectError
MakeAccessDeniedError(std::string_view path);

ObjectError
MakeUnexpectedStatusError(std::string_view path, HttpStatus status);

ObjectError
MakeConnectionFailedError(std::string_view path,
			  std::string_view detail);

/**
 * Wrap the exception currently being handled in a
 * #CONNECTION_FAILED error.  Must be called from inside a "catch"
 * block.
 */
std::exception_ptr
NestConnectionFailedError(std::string_view path,
			  std::string_view detail) noexcept;

} // namespace S3
