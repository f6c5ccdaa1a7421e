#include "internal/factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#if AINP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if AINP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ainp::factory {

using ainp::observability::StringField;

namespace {

#if AINP_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->ApplySchema(db::sql::SqliteSchema());

  sqlite_db->Exec("SELECT id,state,rounds,expires_at_ms FROM negotiations LIMIT 1;");
  sqlite_db->Exec("SELECT agent_did,balance,reserved,earned,spent FROM credit_accounts LIMIT 1;");
  sqlite_db->Exec("SELECT seq,id,agent_did,tx_type,amount FROM credit_transactions LIMIT 1;");
  sqlite_db->Exec("SELECT negotiation_id,status,attempts FROM settlements LIMIT 1;");
  sqlite_db->Exec("SELECT agent_did,usefulness_score FROM agent_usefulness LIMIT 1;");
}
#endif

#if AINP_DB_POSTGRES
// Runs on a connection of its own: pooled connections prepare statements
// against these tables as soon as they open.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,state,rounds,expires_at_ms FROM negotiations LIMIT 1;");
  tx.exec("SELECT agent_did,balance,reserved,earned,spent FROM credit_accounts LIMIT 1;");
  tx.exec("SELECT seq,id,agent_did,tx_type,amount FROM credit_transactions LIMIT 1;");
  tx.exec("SELECT negotiation_id,status,attempts FROM settlements LIMIT 1;");
  tx.exec("SELECT agent_did,usefulness_score FROM agent_usefulness LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ainp::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if AINP_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    AINP_LOG_INFO("using sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if AINP_DB_POSTGRES
    const auto& postgres = database.postgres();
    BootstrapPostgresSchema(postgres.connection_uri());
    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    AINP_LOG_INFO("using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  AINP_LOG_WARN("using in-memory store, state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const ainp::runtime::config::RuntimeConfig& config) {
  Application app;
  app.options = config::BuildEngineOptions(config);

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Ledger + incentives
  // ------------------------------------------------------------------
  app.ledger      = std::make_shared<credit::CreditLedger>(app.repository);
  app.usefulness  = std::make_shared<usefulness::UsefulnessCache>(app.repository);
  app.distributor = std::make_shared<incentive::IncentiveDistributor>(app.repository, app.ledger, app.usefulness);

  // ------------------------------------------------------------------
  // Negotiation + settlement
  // ------------------------------------------------------------------
  app.engine      = std::make_shared<negotiation::NegotiationEngine>(app.repository, app.ledger, app.options);
  app.coordinator = std::make_shared<settlement::SettlementCoordinator>(app.repository, app.ledger, app.distributor, app.options);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  runtime::MaintenanceWorker::Options maintenance;
  maintenance.expiry_interval    = app.options.expiry_interval;
  maintenance.reconcile_interval = app.options.reconcile_interval;
  maintenance.reconcile_batch    = app.options.reconcile_batch;
  app.maintenance = std::make_shared<runtime::MaintenanceWorker>(app.engine, app.coordinator, maintenance);

  return app;
}

} // namespace ainp::factory
