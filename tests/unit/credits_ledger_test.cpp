#include "internal/core/credits_ledger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/test_clock.hpp"

namespace {

using namespace std::chrono_literals;
using namespace workledger::v1;
using workledger::core::CreditsLedger;
using workledger::testing::ManualClock;

struct Fixture {
  ManualClock                                               clock;
  std::shared_ptr<workledger::db::memory::MemoryRepository> repo = std::make_shared<workledger::db::memory::MemoryRepository>();
  CreditsLedger                                             ledger{repo, {}, clock.Fn()};
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void AssertConserved(CreditsLedger& ledger, const std::string& account_id) {
  auto r = ledger.Reconcile(account_id);
  assert(r.consistent);
  assert(r.cached == r.derived);
}

void TestOpenAccountDefaults() {
  Fixture f;
  auto    account = f.ledger.OpenAccount("u1");
  assert(account.credits_remaining() == 100);
  assert(account.lifetime_credits_used() == 0);
  assert(account.subscription_tier() == SUBSCRIPTION_TIER_FREE);
  assert(!account.has_subscription_expires_at());

  assert(f.ledger.OpenAccount("u2", 0, SUBSCRIPTION_TIER_PRO).credits_remaining() == 0);
  assert(f.ledger.ListTransactions("u1").empty());

  assert(Throws<workledger::util::AlreadyExists>([&] { f.ledger.OpenAccount("u1"); }));
  assert(Throws<workledger::util::InvalidAmount>([&] { f.ledger.OpenAccount("u3", -1); }));
  assert(Throws<workledger::util::UserNotFound>([&] { f.ledger.GetBalance("u3"); }));
}

void TestDebitAppendsNegativeEntry() {
  Fixture f;
  f.ledger.OpenAccount("u1");

  auto entry = f.ledger.Debit("u1", 30, "image generation", std::string("job-1"));
  assert(entry.amount() == -30);
  assert(entry.balance_after() == 70);
  assert(entry.transaction_type() == TRANSACTION_TYPE_GENERATION);
  assert(entry.reference_id() == "job-1");
  assert(!entry.id().empty());

  auto balance = f.ledger.GetBalance("u1");
  assert(balance.credits_remaining() == 70);
  assert(balance.lifetime_credits_used() == 30);
  AssertConserved(f.ledger, "u1");
}

void TestDebitRejectionsLeaveNoTrace() {
  Fixture f;
  f.ledger.OpenAccount("u1", 10);

  try {
    f.ledger.Debit("u1", 11, "too much");
    assert(false);
  } catch (const workledger::util::InsufficientCredits& e) {
    assert(e.Available() == 10);
    assert(e.Required() == 11);
  }

  assert(Throws<workledger::util::InvalidAmount>([&] { f.ledger.Debit("u1", 0, "zero"); }));
  assert(Throws<workledger::util::InvalidAmount>([&] { f.ledger.Debit("u1", -5, "negative"); }));
  assert(Throws<workledger::util::InvalidArgument>([&] { f.ledger.Debit("u1", 1, "wrong type", std::nullopt, TRANSACTION_TYPE_PURCHASE); }));
  assert(Throws<workledger::util::UserNotFound>([&] { f.ledger.Debit("ghost", 1, "nobody"); }));

  assert(f.ledger.GetBalance("u1").credits_remaining() == 10);
  assert(f.ledger.ListTransactions("u1").empty());

  // exact balance is allowed and reaches zero
  assert(f.ledger.Debit("u1", 10, "all of it").balance_after() == 0);
  AssertConserved(f.ledger, "u1");
}

void TestCreditTypesAndLifetimeUsage() {
  Fixture f;
  f.ledger.OpenAccount("u1", 0);

  auto entry = f.ledger.Credit("u1", 500, TRANSACTION_TYPE_PURCHASE, "credit pack", std::string("stripe_pi_1"));
  assert(entry.amount() == 500);
  assert(entry.balance_after() == 500);

  f.ledger.Debit("u1", 20, "correction", std::nullopt, TRANSACTION_TYPE_ADJUSTMENT);
  f.ledger.Credit("u1", 20, TRANSACTION_TYPE_REFUND, "failed job refund");

  auto balance = f.ledger.GetBalance("u1");
  assert(balance.credits_remaining() == 500);
  assert(balance.lifetime_credits_used() == 20);

  assert(Throws<workledger::util::InvalidArgument>([&] { f.ledger.Credit("u1", 1, TRANSACTION_TYPE_GENERATION, "nope"); }));
  assert(Throws<workledger::util::InvalidAmount>([&] { f.ledger.Credit("u1", 0, TRANSACTION_TYPE_BONUS, "nope"); }));
  assert(Throws<workledger::util::InvalidAmount>(
      [&] { f.ledger.Credit("u1", std::numeric_limits<int64_t>::max(), TRANSACTION_TYPE_BONUS, "overflow"); }));
  assert(Throws<workledger::util::UserNotFound>([&] { f.ledger.Credit("ghost", 1, TRANSACTION_TYPE_BONUS, "nobody"); }));

  AssertConserved(f.ledger, "u1");
}

void TestListTransactionsNewestFirstWithPaging() {
  Fixture f;
  f.ledger.OpenAccount("u1", 100);

  f.ledger.Debit("u1", 1, "first");
  f.clock.Advance(1s);
  f.ledger.Debit("u1", 2, "second");
  // same millisecond: insertion order breaks the tie
  f.ledger.Debit("u1", 3, "third");

  auto page = f.ledger.ListTransactions("u1", 2, 0);
  assert(page.size() == 2);
  assert(page[0].description() == "third");
  assert(page[1].description() == "second");

  auto rest = f.ledger.ListTransactions("u1", 2, 2);
  assert(rest.size() == 1);
  assert(rest[0].description() == "first");

  assert(f.ledger.ListTransactions("u1", 0).size() == 1);
  assert(Throws<workledger::util::UserNotFound>([&] { f.ledger.ListTransactions("ghost"); }));
}

void TestSetSubscription() {
  Fixture f;
  f.ledger.OpenAccount("u1");

  const auto expires = f.clock.Now() + std::chrono::hours(24 * 30);
  auto       account = f.ledger.SetSubscription("u1", SUBSCRIPTION_TIER_PRO, expires, std::string("sub_123"));
  assert(account.subscription_tier() == SUBSCRIPTION_TIER_PRO);
  assert(account.external_subscription_ref() == "sub_123");
  assert(workledger::util::FromProto(account.subscription_expires_at()) == expires);

  // balance untouched, no ledger row
  assert(account.credits_remaining() == 100);
  assert(f.ledger.ListTransactions("u1").empty());

  auto cleared = f.ledger.SetSubscription("u1", SUBSCRIPTION_TIER_FREE, std::nullopt);
  assert(!cleared.has_subscription_expires_at());
  assert(cleared.external_subscription_ref().empty());
}

void TestGrantSubscriptionCreditsAllowance() {
  Fixture f;
  f.ledger.OpenAccount("u1", 5);

  auto granted = f.ledger.GrantSubscription("u1", SUBSCRIPTION_TIER_PRO, GRANT_DURATION_MONTHLY);
  assert(granted.credits_added == 500);
  assert(granted.credits.credits_remaining() == 505);
  assert(granted.credits.subscription_tier() == SUBSCRIPTION_TIER_PRO);
  assert(granted.credits.external_subscription_ref().rfind("admin_grant_", 0) == 0);

  // 2023-11-14 + 1 month
  const auto expires = workledger::util::FromProto(granted.credits.subscription_expires_at());
  assert(expires - f.clock.Now() == std::chrono::hours(24 * 30));

  auto history = f.ledger.ListTransactions("u1");
  assert(history.size() == 1);
  assert(history[0].transaction_type() == TRANSACTION_TYPE_BONUS);
  assert(history[0].amount() == 500);
  assert(history[0].description() == "Admin granted pro monthly subscription");
  assert(history[0].reference_id().rfind("admin_grant_u1_", 0) == 0);

  auto yearly = f.ledger.GrantSubscription("u1", SUBSCRIPTION_TIER_ENTERPRISE, GRANT_DURATION_YEARLY);
  assert(yearly.credits_added == 2000);
  assert(workledger::util::FromProto(yearly.credits.subscription_expires_at()) - f.clock.Now() == std::chrono::hours(24 * 366));

  AssertConserved(f.ledger, "u1");
}

} // namespace

int main() {
  TestOpenAccountDefaults();
  TestDebitAppendsNegativeEntry();
  TestDebitRejectionsLeaveNoTrace();
  TestCreditTypesAndLifetimeUsage();
  TestListTransactionsNewestFirstWithPaging();
  TestSetSubscription();
  TestGrantSubscriptionCreditsAllowance();

  std::cout << "workledger_unit_credits_ledger: pass\n";
  return 0;
}
