#pragma once

#include "ainp/broker/core/v1/credit.pb.h"
#include "ainp/broker/core/v1/distribution.pb.h"
#include "ainp/broker/core/v1/negotiation.pb.h"

namespace ainp::broker::v1 {
using namespace ::ainp::broker::core::v1;
}
