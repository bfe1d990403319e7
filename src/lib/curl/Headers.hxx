// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <map>
#include <string>

namespace Curl {

/**
 * Response headers; names are lower case.
 */
using Headers = std::multimap<std::string, std::string, std::less<>>;

} // namespace Curl
