#pragma once

#include <string>

#include "ainp/broker/v1.hpp"
#include "internal/db/model/negotiation_record.hpp"

namespace ainp::negotiation {

// "initiated", "proposed", ... as stored in negotiations.state
std::string                        StateName(ainp::broker::v1::NegotiationState state);
ainp::broker::v1::NegotiationState ParseState(const std::string& name);

bool IsTerminal(ainp::broker::v1::NegotiationState state);

db::model::NegotiationRecord         ToRecord(const ainp::broker::v1::NegotiationSession& session);
ainp::broker::v1::NegotiationSession FromRecord(const db::model::NegotiationRecord& record);

} // namespace ainp::negotiation
