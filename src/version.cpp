// src/version.cpp
// @brief Version accessor; must match the version in CMakeLists.txt.

#include "morlock/version.hpp"

namespace morlock
{
const char *morlock_version() noexcept
{
    return MORLOCK_VERSION_STRING;
}
} // namespace morlock
