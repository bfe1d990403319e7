// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

class CurlEasy;

namespace Curl {

/**
 * Apply the default options of this project to a #CurlEasy:
 * user agent, no progress meter, no signals, a connect timeout and
 * a small number of redirects.
 */
void
Setup(CurlEasy &easy);

} // namespace Curl
