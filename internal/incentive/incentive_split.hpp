#pragma once

#include "ainp/broker/v1.hpp"

namespace ainp::incentive {

// Allowed deviation of a split's sum from 1.0.
inline constexpr double kSplitTolerance = 0.001;

// 0.70 agent / 0.10 broker / 0.10 validator / 0.10 pool
ainp::broker::v1::IncentiveSplit DefaultSplit();

// Non-negative finite fractions summing to 1.0 within kSplitTolerance.
bool IsValidSplit(const ainp::broker::v1::IncentiveSplit& split);

} // namespace ainp::incentive
