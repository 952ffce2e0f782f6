// src/ui/distribute.cpp
// @brief Round-robin size negotiation.
// @invariant Extra cells are granted in participant order, one per pass each.
// @ownership Returns an owned allocation vector.

#include "morlock/ui/distribute.hpp"

#include <cstddef>

namespace morlock::ui
{

std::vector<int> distribute(int total, const std::vector<SizeReq> &reqs)
{
    std::vector<int> sizes(reqs.size());
    long long remaining = total > 0 ? total : 0;
    for (std::size_t i = 0; i < reqs.size(); ++i)
    {
        sizes[i] = reqs[i].min;
        remaining -= reqs[i].min;
    }

    bool grew = true;
    while (remaining > 0 && grew)
    {
        grew = false;
        for (std::size_t i = 0; i < reqs.size() && remaining > 0; ++i)
        {
            if (sizes[i] >= reqs[i].max)
            {
                continue;
            }
            ++sizes[i];
            --remaining;
            grew = true;
        }
    }
    return sizes;
}

} // namespace morlock::ui
