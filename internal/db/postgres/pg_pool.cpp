#include "pg_pool.hpp"

namespace workledger::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    // a connection dropped by the server is replaced, not handed out
    if (conn->is_open()) return Wrap(conn.release());
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kJobColumns =
      "seq,id,type,status,priority,owner_id,payload::text,result::text,error,attempts,max_attempts,"
      "created_at_ms,started_at_ms,completed_at_ms,scheduled_for_ms,heartbeat_at_ms";

  static constexpr const char* kAccountColumns =
      "id,credits_remaining,starting_credits,lifetime_credits_used,subscription_tier,"
      "subscription_expires_at_ms,external_subscription_ref,created_at_ms,updated_at_ms";

  conn.prepare("get_job", std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=$1");
  conn.prepare("lock_job", std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=$1 FOR UPDATE");

  conn.prepare("update_job",
               "UPDATE jobs SET status=$2,priority=$3,payload=$4::jsonb,result=$5::jsonb,error=$6,attempts=$7,max_attempts=$8,"
               "started_at_ms=$9,completed_at_ms=$10,scheduled_for_ms=$11,heartbeat_at_ms=$12 WHERE id=$1");

  conn.prepare("get_account", std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id=$1");
  conn.prepare("lock_account", std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id=$1 FOR UPDATE");

  conn.prepare("update_account",
               "UPDATE accounts SET credits_remaining=$2,lifetime_credits_used=$3,subscription_tier=$4,"
               "subscription_expires_at_ms=$5,external_subscription_ref=$6,updated_at_ms=$7 WHERE id=$1");

  conn.prepare("insert_credit_tx",
               "INSERT INTO credit_transactions(id,account_id,amount,transaction_type,description,reference_id,balance_after,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING seq");
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

} // namespace workledger::db::postgres
