#include "internal/negotiation/convergence.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ainp::negotiation {

using ainp::broker::v1::NegotiationRound;
using ainp::broker::v1::ProposalTerms;

namespace {

void AddRelative(double a, double b, std::vector<double>* similarities) {
  const double largest = std::max(a, b);
  if (largest == 0.0) {
    return;
  }
  similarities->push_back(1.0 - std::fabs(a - b) / largest);
}

} // namespace

double ProposalSimilarity(const ProposalTerms& a, const ProposalTerms& b) {
  std::vector<double> similarities;

  if (a.has_price() && b.has_price()) {
    AddRelative(a.price(), b.price(), &similarities);
  }

  if (a.has_delivery_time() && b.has_delivery_time()) {
    AddRelative(a.delivery_time(), b.delivery_time(), &similarities);
  }

  if (a.has_quality_sla() && b.has_quality_sla()) {
    similarities.push_back(1.0 - std::fabs(a.quality_sla() - b.quality_sla()));
  }

  if (a.has_incentive_split() && b.has_incentive_split()) {
    const auto& sa   = a.incentive_split();
    const auto& sb   = b.incentive_split();
    const double diff = (std::fabs(sa.agent() - sb.agent()) + std::fabs(sa.broker() - sb.broker()) +
                         std::fabs(sa.validator() - sb.validator()) + std::fabs(sa.pool() - sb.pool())) /
                        4.0;
    similarities.push_back(1.0 - diff);
  }

  if (similarities.empty()) {
    return 0.0;
  }

  double total = 0.0;
  for (const double similarity : similarities) total += similarity;
  return std::clamp(total / static_cast<double>(similarities.size()), 0.0, 1.0);
}

double SessionConvergence(const google::protobuf::RepeatedPtrField<NegotiationRound>& rounds) {
  const int count = rounds.size();
  if (count < 2) {
    return 0.0;
  }
  return ProposalSimilarity(rounds.Get(count - 2).proposal(), rounds.Get(count - 1).proposal());
}

} // namespace ainp::negotiation
