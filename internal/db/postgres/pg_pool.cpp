#include "pg_pool.hpp"

namespace claims::db::postgres {

namespace {

constexpr const char* kClaimColumns =
    "id,type,status,priority,severity,domain,title,description,metadata,"
    "claimant_id,claimant_kind,claimant_name,claimant_domain,claimant_agent_type,"
    "claimed_at_ms,last_activity_at_ms,ttl_ms,created_at_ms,updated_at_ms,steal_count,correlation_id,blocked_reason,"
    "result_success,result_summary,result_artifacts,result_time_spent_ms,version";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = kClaimColumns;

  conn.prepare("get_claim", "SELECT " + columns + " FROM claims WHERE id=$1");
  conn.prepare("get_claim_for_update", "SELECT " + columns + " FROM claims WHERE id=$1 FOR UPDATE");

  conn.prepare("insert_claim", "INSERT INTO claims(" + columns +
                                   ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,$23,$24,$25,$26,$27)");

  conn.prepare("update_claim",
               "UPDATE claims SET type=$2,status=$3,priority=$4,severity=$5,domain=$6,title=$7,description=$8,metadata=$9,"
               "claimant_id=$10,claimant_kind=$11,claimant_name=$12,claimant_domain=$13,claimant_agent_type=$14,"
               "claimed_at_ms=$15,last_activity_at_ms=$16,ttl_ms=$17,created_at_ms=$18,updated_at_ms=$19,steal_count=$20,"
               "correlation_id=$21,blocked_reason=$22,result_success=$23,result_summary=$24,result_artifacts=$25,"
               "result_time_spent_ms=$26,version=$27 WHERE id=$1 AND version=$28");

  conn.prepare("list_claims", "SELECT " + columns + " FROM claims");

  conn.prepare("find_stale_claims", "SELECT " + columns +
                                        " FROM claims WHERE status IN ('claimed','in-progress','blocked') "
                                        "AND $1 > last_activity_at_ms AND $1 - last_activity_at_ms > ttl_ms");

  conn.prepare("delete_claim", "DELETE FROM claims WHERE id=$1");

  conn.prepare("get_history", "SELECT from_status,to_status,actor,reason,timestamp_ms,previous_claimant FROM claim_history WHERE claim_id=$1 ORDER BY seq");
  conn.prepare("insert_history",
               "INSERT INTO claim_history(claim_id,seq,from_status,to_status,actor,reason,timestamp_ms,previous_claimant) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("get_previous_claimants",
               "SELECT claimant_id,kind,name,domain,agent_type FROM claim_previous_claimants WHERE claim_id=$1 ORDER BY seq");
  conn.prepare("clear_previous_claimants", "DELETE FROM claim_previous_claimants WHERE claim_id=$1");
  conn.prepare("insert_previous_claimant",
               "INSERT INTO claim_previous_claimants(claim_id,seq,claimant_id,kind,name,domain,agent_type) VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("get_tags", "SELECT tag FROM claim_tags WHERE claim_id=$1 ORDER BY seq");
  conn.prepare("clear_tags", "DELETE FROM claim_tags WHERE claim_id=$1");
  conn.prepare("insert_tag", "INSERT INTO claim_tags(claim_id,seq,tag) VALUES($1,$2,$3)");
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

} // namespace claims::db::postgres
