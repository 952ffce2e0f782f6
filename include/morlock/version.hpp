// include/morlock/version.hpp
// @brief Library version string.
// @invariant morlock_version() returns a non-null, null-terminated string.
// @ownership The returned string has static storage duration and must not be freed.
#pragma once

namespace morlock
{
const char *morlock_version() noexcept;
} // namespace morlock
