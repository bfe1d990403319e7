// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>

#include <sys/uio.h>

constexpr struct iovec
MakeIovec(std::span<const std::byte> s) noexcept
{
	return { const_cast<std::byte *>(s.data()), s.size() };
}
