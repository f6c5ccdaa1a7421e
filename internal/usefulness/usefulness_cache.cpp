#include "internal/usefulness/usefulness_cache.hpp"

#include <algorithm>
#include <cmath>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/util/errors.hpp"

namespace ainp::usefulness {

UsefulnessCache::UsefulnessCache(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

double UsefulnessCache::Update(const std::string& agent_did, double score) {
  if (agent_did.empty()) {
    throw util::ValidationError("agent_did must not be empty");
  }
  if (std::isnan(score)) {
    throw util::ValidationError("usefulness score must be a number");
  }

  db::model::UsefulnessScoreRecord record;
  record.agent_did        = agent_did;
  record.usefulness_score = std::clamp(score, kMinScore, kMaxScore);
  record.updated_at_ms    = util::ToUnixMillis(clock_());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertUsefulnessScore(*tx, record), "update usefulness score for " + agent_did);
  tx->Commit();
  return record.usefulness_score;
}

std::optional<double> UsefulnessCache::Get(const std::string& agent_did) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetUsefulnessScore(*tx, agent_did);
  tx->Commit();

  if (!record) return std::nullopt;
  return record->usefulness_score;
}

std::vector<AgentScore> UsefulnessCache::Qualifying(double min_score) {
  auto tx     = repository_->Begin();
  auto scores = Qualifying(*tx, min_score);
  tx->Commit();
  return scores;
}

std::vector<AgentScore> UsefulnessCache::Qualifying(db::Transaction& tx, double min_score) {
  std::vector<AgentScore> scores;
  for (const auto& record : repository_->ListUsefulnessScores(tx, min_score)) {
    scores.push_back({record.agent_did, record.usefulness_score});
  }

  std::sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) { return a.agent_did < b.agent_did; });
  return scores;
}

} // namespace ainp::usefulness
