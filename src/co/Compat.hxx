// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <coroutine>

#ifndef __cpp_impl_coroutine
#error Need -fcoroutines
#endif
