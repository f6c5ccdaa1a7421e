#include "internal/incentive/incentive_split.hpp"

#include <cmath>

namespace ainp::incentive {

using ainp::broker::v1::IncentiveSplit;

IncentiveSplit DefaultSplit() {
  IncentiveSplit split;
  split.set_agent(0.70);
  split.set_broker(0.10);
  split.set_validator(0.10);
  split.set_pool(0.10);
  return split;
}

bool IsValidSplit(const IncentiveSplit& split) {
  for (const double fraction : {split.agent(), split.broker(), split.validator(), split.pool()}) {
    if (!std::isfinite(fraction) || fraction < 0.0) {
      return false;
    }
  }

  const double sum = split.agent() + split.broker() + split.validator() + split.pool();
  return std::fabs(sum - 1.0) <= kSplitTolerance;
}

} // namespace ainp::incentive
