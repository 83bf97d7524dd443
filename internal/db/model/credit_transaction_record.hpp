#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "workledger/v1.hpp"

namespace workledger::db::model {

// Append-only ledger entry. Never updated or deleted.
struct CreditTransactionRecord {
  uint64_t    seq = 0;
  std::string id;
  std::string account_id;

  // negative for debits
  int64_t amount = 0;

  v1::TransactionType        transaction_type = v1::TRANSACTION_TYPE_UNSPECIFIED;
  std::string                description;
  std::optional<std::string> reference_id;

  int64_t  balance_after = 0;
  uint64_t created_at_ms = 0;
};

struct Pagination {
  uint32_t limit  = 20;
  uint32_t offset = 0;
};

} // namespace workledger::db::model
