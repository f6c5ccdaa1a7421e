#include "pg_pool.hpp"

namespace ainp::db::postgres {

#define AINP_PG_NEGOTIATION_COLUMNS                                                                      \
  "id,intent_id,initiator_did,responder_did,state,rounds::text,convergence_score,current_proposal::text," \
  "final_proposal::text,incentive_split::text,max_rounds,created_at_ms,expires_at_ms,updated_at_ms"

#define AINP_PG_SETTLEMENT_COLUMNS                                                                      \
  "negotiation_id,intent_id,payer_did,payee_did,validator_did,usefulness_proof_id,amount,"              \
  "incentive_split::text,status,attempts,last_error,created_at_ms,updated_at_ms"

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // accounts
  conn.prepare("insert_account",
               "INSERT INTO credit_accounts(agent_did,balance,reserved,earned,spent,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("get_account",
               "SELECT agent_did,balance,reserved,earned,spent,created_at_ms,updated_at_ms "
               "FROM credit_accounts WHERE agent_did=$1");
  conn.prepare("lock_account",
               "SELECT agent_did,balance,reserved,earned,spent,created_at_ms,updated_at_ms "
               "FROM credit_accounts WHERE agent_did=$1 FOR UPDATE");
  conn.prepare("update_account",
               "UPDATE credit_accounts SET balance=$2,reserved=$3,earned=$4,spent=$5,updated_at_ms=$6 WHERE agent_did=$1");

  // ledger
  conn.prepare("insert_credit_transaction",
               "INSERT INTO credit_transactions(id,agent_did,tx_type,amount,intent_id,usefulness_proof_id,metadata,created_at_ms) "
               "VALUES($1,$2,$3,$4,NULLIF($5,''),NULLIF($6,''),$7::jsonb,$8) RETURNING seq");
  conn.prepare("list_credit_transactions",
               "SELECT seq,id,agent_did,tx_type,amount,COALESCE(intent_id,''),COALESCE(usefulness_proof_id,''),metadata::text,created_at_ms "
               "FROM credit_transactions WHERE agent_did=$1 ORDER BY seq DESC LIMIT $2 OFFSET $3");

  // negotiations
  conn.prepare("insert_negotiation",
               "INSERT INTO negotiations(id,intent_id,initiator_did,responder_did,state,rounds,convergence_score,"
               "current_proposal,final_proposal,incentive_split,max_rounds,created_at_ms,expires_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,NULLIF($8,'')::jsonb,NULLIF($9,'')::jsonb,NULLIF($10,'')::jsonb,$11,$12,$13,$14)");
  conn.prepare("get_negotiation", "SELECT " AINP_PG_NEGOTIATION_COLUMNS " FROM negotiations WHERE id=$1");
  conn.prepare("lock_negotiation", "SELECT " AINP_PG_NEGOTIATION_COLUMNS " FROM negotiations WHERE id=$1 FOR UPDATE");
  conn.prepare("update_negotiation",
               "UPDATE negotiations SET state=$2,rounds=$3::jsonb,convergence_score=$4,current_proposal=NULLIF($5,'')::jsonb,"
               "final_proposal=NULLIF($6,'')::jsonb,incentive_split=NULLIF($7,'')::jsonb,updated_at_ms=$8 WHERE id=$1");
  conn.prepare("list_negotiations_by_agent",
               "SELECT " AINP_PG_NEGOTIATION_COLUMNS " FROM negotiations "
               "WHERE (initiator_did=$1 OR responder_did=$1) AND ($2::text IS NULL OR state=$2) "
               "ORDER BY created_at_ms DESC, id DESC");
  conn.prepare("expire_negotiations",
               "UPDATE negotiations SET state='expired',updated_at_ms=$1 "
               "WHERE id IN (SELECT id FROM negotiations "
               "WHERE state NOT IN ('accepted','rejected','expired') AND expires_at_ms<=$1 "
               "ORDER BY id FOR UPDATE) RETURNING id");

  // settlements
  conn.prepare("insert_settlement",
               "INSERT INTO settlements(negotiation_id,intent_id,payer_did,payee_did,validator_did,usefulness_proof_id,amount,"
               "incentive_split,status,attempts,last_error,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,NULLIF($5,''),NULLIF($6,''),$7,$8::jsonb,$9,$10,NULLIF($11,''),$12,$13)");
  conn.prepare("get_settlement", "SELECT " AINP_PG_SETTLEMENT_COLUMNS " FROM settlements WHERE negotiation_id=$1");
  conn.prepare("lock_settlement", "SELECT " AINP_PG_SETTLEMENT_COLUMNS " FROM settlements WHERE negotiation_id=$1 FOR UPDATE");
  conn.prepare("update_settlement",
               "UPDATE settlements SET status=$2,attempts=$3,last_error=NULLIF($4,''),updated_at_ms=$5 WHERE negotiation_id=$1");
  conn.prepare("list_settlements_by_status",
               "SELECT " AINP_PG_SETTLEMENT_COLUMNS " FROM settlements WHERE status=$1 "
               "ORDER BY created_at_ms ASC, negotiation_id ASC LIMIT $2");

  // usefulness
  conn.prepare("upsert_usefulness",
               "INSERT INTO agent_usefulness(agent_did,usefulness_score,updated_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(agent_did) DO UPDATE SET usefulness_score=EXCLUDED.usefulness_score,updated_at_ms=EXCLUDED.updated_at_ms");
  conn.prepare("get_usefulness", "SELECT agent_did,usefulness_score,updated_at_ms FROM agent_usefulness WHERE agent_did=$1");
  conn.prepare("list_usefulness_at_least",
               "SELECT agent_did,usefulness_score,updated_at_ms FROM agent_usefulness "
               "WHERE usefulness_score>=$1 ORDER BY agent_did");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace ainp::db::postgres
