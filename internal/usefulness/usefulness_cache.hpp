#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ainp::usefulness {

inline constexpr double kMinScore = 0.0;
inline constexpr double kMaxScore = 100.0;

struct AgentScore {
  std::string agent_did;
  double      score = 0.0;
};

/*
  Cached per-agent usefulness score (0..100), refreshed by whatever
  aggregates usefulness proofs and read by the reward distribution.
*/
class UsefulnessCache {
 public:
  explicit UsefulnessCache(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  // Clamps to [0, 100]; returns the stored score.
  double Update(const std::string& agent_did, double score);

  std::optional<double> Get(const std::string& agent_did);

  // Agents with score >= min_score, ordered by DID.
  std::vector<AgentScore> Qualifying(double min_score);
  std::vector<AgentScore> Qualifying(db::Transaction& tx, double min_score);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace ainp::usefulness
