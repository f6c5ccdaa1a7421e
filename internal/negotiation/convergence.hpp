#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include "ainp/broker/v1.hpp"

namespace ainp::negotiation {

/*
  Convergence scoring.

  Each term present in both proposals contributes one similarity in [0,1]:
    price, delivery_time   1 - |a-b| / max(a,b)   (skipped when max == 0)
    quality_sla            1 - |a-b|
    incentive_split        1 - mean |delta| over the four fractions
  The score is the mean of the contributions, 0 when nothing compares.
*/
double ProposalSimilarity(const ainp::broker::v1::ProposalTerms& a, const ainp::broker::v1::ProposalTerms& b);

// Similarity of the two most recent rounds; 0 with fewer than two.
double SessionConvergence(const google::protobuf::RepeatedPtrField<ainp::broker::v1::NegotiationRound>& rounds);

} // namespace ainp::negotiation
