// include/morlock/ui/distribute.hpp
// @brief Size negotiation splitting a linear budget among (min, max) participants.
// @invariant Allocations stay within [min, max]; growth stops when the budget is spent.
// @ownership Stateless; returns an owned vector.
#pragma once

#include "morlock/ui/size.hpp"

#include <vector>

namespace morlock::ui
{

/// @brief Split @p total among participants described by @p reqs.
/// @details Every participant first receives its minimum.  The budget left
///          after minimums is handed out one cell at a time, visiting the
///          participants in order and skipping those already at their maximum,
///          until the budget runs out or nobody can grow.  When @p total is
///          below the sum of minimums the minimums are returned as-is and the
///          sum exceeds @p total.  Negative totals behave like zero.
/// @param total Cells available along the axis.
/// @param reqs One requirement per participant, in order.
/// @return One allocation per participant, in the same order.
std::vector<int> distribute(int total, const std::vector<SizeReq> &reqs);

} // namespace morlock::ui
