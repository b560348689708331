#include <assert.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/reservation/reservation_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using outflow::db::memory::MemoryRepository;
using outflow::inventory::InventoryLedger;
using outflow::model::LevelKey;
using outflow::model::ReservationStatus;
using outflow::reservation::ReservationManager;

struct Fixture {
  std::shared_ptr<MemoryRepository>   repo;
  std::shared_ptr<InventoryLedger>    ledger;
  std::shared_ptr<ReservationManager> reservations;
};

Fixture MakeFixture(std::chrono::milliseconds ttl = std::chrono::hours(24)) {
  Fixture f;
  f.repo         = std::make_shared<MemoryRepository>();
  f.ledger       = std::make_shared<InventoryLedger>(f.repo, outflow::util::RetryPolicy{});
  f.reservations = std::make_shared<ReservationManager>(f.repo, f.ledger, ttl);
  return f;
}

outflow::model::MovementReference IssueRef(const std::string& request_id) {
  outflow::model::MovementReference reference;
  reference.reference_type = "SERVICE";
  reference.reference_id   = request_id;
  reference.created_by     = "tech-1";
  reference.unit_cost      = 5000;
  return reference;
}

void TestReserveHoldsAvailableStockOnly() {
  auto           f = MakeFixture();
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 10, "admin");

  auto reservation = f.reservations->Reserve("req-1", key, 4, "tech-1");
  assert(reservation.status == ReservationStatus::kActive);
  assert(reservation.expires_at_ms > reservation.reserved_at_ms);

  auto level = f.ledger->GetLevel(key);
  assert(level->current_stock == 10);
  assert(level->reserved_stock == 4);
  assert(level->available_stock() == 6);
  // Holding stock is not a ledger event.
  assert(f.ledger->Movements(key).size() == 1);

  f.reservations->Release(reservation.id, "cancelled");
  level = f.ledger->GetLevel(key);
  assert(level->reserved_stock == 0);
  assert(f.reservations->Get(reservation.id)->status == ReservationStatus::kReleased);
  assert(f.reservations->Get(reservation.id)->release_reason == "cancelled");
}

void TestShortfallCarriesRequestContext() {
  auto           f = MakeFixture();
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 3, "admin");

  bool threw = false;
  try {
    f.reservations->Reserve("req-10", key, 10, "tech-1");
  } catch (const outflow::util::InsufficientStock& e) {
    threw = true;
    assert(e.Context().request_id == "req-10");
    assert(e.Context().spare_part_id == "part-1");
    assert(e.Context().store_id == "store-1");
    assert(e.Context().requested == 10);
    assert(e.Context().available == 3);
    assert(e.Context().shortfall == 7);
  }
  assert(threw);
  assert(f.ledger->GetLevel(key)->reserved_stock == 0);
}

void TestOneActiveReservationPerRequest() {
  auto           f = MakeFixture();
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 10, "admin");

  f.reservations->Reserve("req-1", key, 2, "tech-1");
  bool threw = false;
  try {
    f.reservations->Reserve("req-1", key, 2, "tech-1");
  } catch (const outflow::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(f.ledger->GetLevel(key)->reserved_stock == 2);
}

void TestConsumeWritesSingleOutMovement() {
  auto           f = MakeFixture();
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 10, "admin");

  auto reservation = f.reservations->Reserve("req-1", key, 2, "tech-1");
  auto movement    = f.reservations->Consume(reservation.id, IssueRef("req-1"));
  assert(movement.movement_type == outflow::model::MovementType::kOut);
  assert(movement.quantity == -2);
  assert(movement.previous_stock == 10);
  assert(movement.new_stock == 8);
  assert(movement.unit_cost == 5000);

  auto level = f.ledger->GetLevel(key);
  assert(level->current_stock == 8);
  assert(level->reserved_stock == 0);
  assert(f.reservations->Get(reservation.id)->status == ReservationStatus::kConsumed);

  bool threw = false;
  try {
    f.reservations->Consume(reservation.id, IssueRef("req-1"));
  } catch (const outflow::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw && "a reservation is consumed at most once");
  assert(f.ledger->Replay(key) == 8);
}

void TestExpiredReservationIsReleasedNotConsumed() {
  auto           f = MakeFixture(std::chrono::milliseconds(0));
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 5, "admin");

  auto reservation = f.reservations->Reserve("req-1", key, 5, "tech-1");

  bool threw = false;
  try {
    f.reservations->Consume(reservation.id, IssueRef("req-1"));
  } catch (const outflow::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(f.ledger->GetLevel(key)->current_stock == 5);

  assert(f.reservations->ReleaseExpired(outflow::util::NowMs() + 1) == 1);
  assert(f.reservations->Get(reservation.id)->status == ReservationStatus::kExpired);
  assert(f.ledger->GetLevel(key)->reserved_stock == 0);
  assert(f.reservations->ReleaseExpired(outflow::util::NowMs() + 1) == 0);
}

void TestExtendMovesExpiryForward() {
  auto           f = MakeFixture(std::chrono::minutes(5));
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 5, "admin");

  auto reservation = f.reservations->Reserve("req-1", key, 1, "tech-1");
  auto extended    = f.reservations->Extend(reservation.id, reservation.expires_at_ms + 60000);
  assert(extended.expires_at_ms == reservation.expires_at_ms + 60000);

  bool threw = false;
  try {
    f.reservations->Extend(reservation.id, reservation.expires_at_ms);
  } catch (const outflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentReservationsNeverExceedStock() {
  auto           f = MakeFixture();
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 10, "admin");

  std::mutex               ids_mutex;
  std::vector<std::string> reservation_ids;
  std::atomic<int>         rejected{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 30; ++i) {
    threads.emplace_back([&, i] {
      try {
        auto reservation = f.reservations->Reserve("req-" + std::to_string(i), key, 1, "tech-1");
        std::lock_guard<std::mutex> lock(ids_mutex);
        reservation_ids.push_back(reservation.id);
      } catch (const outflow::util::InsufficientStock&) {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads)
    thread.join();

  assert(reservation_ids.size() == 10);
  assert(rejected.load() == 20);
  assert(f.ledger->GetLevel(key)->reserved_stock == 10);
  assert(f.ledger->GetLevel(key)->available_stock() == 0);

  threads.clear();
  for (const auto& id : reservation_ids) {
    threads.emplace_back([&, id] { f.reservations->Consume(id, IssueRef(id)); });
  }
  for (auto& thread : threads)
    thread.join();

  auto level = f.ledger->GetLevel(key);
  assert(level->current_stock == 0);
  assert(level->reserved_stock == 0);
  assert(f.ledger->Replay(key) == 0);
  assert(f.ledger->Movements(key).size() == 11);
}

void TestConcurrentKeysRetryThroughConflicts() {
  auto f = MakeFixture();
  f.ledger->InitializeLevel({"part-1", "store-a"}, 50, "admin");
  f.ledger->InitializeLevel({"part-1", "store-b"}, 50, "admin");

  // Different keys share no lock, so their transactions overlap.
  std::vector<std::thread> threads;
  for (int i = 0; i < 20; ++i) {
    threads.emplace_back([&, i] {
      const LevelKey key{"part-1", i % 2 == 0 ? "store-a" : "store-b"};
      auto           reservation = f.reservations->Reserve("req-" + std::to_string(i), key, 2, "tech-1");
      f.reservations->Consume(reservation.id, IssueRef(reservation.request_id));
    });
  }
  for (auto& thread : threads)
    thread.join();

  for (const auto* store : {"store-a", "store-b"}) {
    const LevelKey key{"part-1", store};
    auto           level = f.ledger->GetLevel(key);
    assert(level->current_stock == 30);
    assert(level->reserved_stock == 0);
    assert(f.ledger->Replay(key) == 30);
  }
}

void AssertReservedWithinStock(InventoryLedger& ledger, const LevelKey& key) {
  auto level = ledger.GetLevel(key);
  assert(level.has_value());
  assert(level->reserved_stock >= 0);
  assert(level->reserved_stock <= level->current_stock);
  assert(ledger.Replay(key) == level->current_stock);
}

void TestDisjointKeysNeverSeeStaleState() {
  auto f = MakeFixture();
  constexpr int kThreads = 16;
  constexpr int kRounds  = 50;
  for (int i = 0; i < kThreads; ++i) {
    f.ledger->InitializeLevel({"part-" + std::to_string(i), "store-1"}, kRounds, "admin");
  }

  std::atomic<int>         stale{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      const LevelKey key{"part-" + std::to_string(i), "store-1"};
      for (int round = 0; round < kRounds; ++round) {
        try {
          f.reservations->Reserve("req-" + std::to_string(i) + "-" + std::to_string(round), key, 1, "tech-1");
        } catch (const outflow::util::StaleState&) {
          stale.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads)
    thread.join();

  assert(stale.load() == 0);
  for (int i = 0; i < kThreads; ++i) {
    const LevelKey key{"part-" + std::to_string(i), "store-1"};
    assert(f.ledger->GetLevel(key)->reserved_stock == kRounds);
    assert(f.ledger->GetLevel(key)->available_stock() == 0);
  }
}

void TestMixedReserveReleaseConsumeKeepInvariant() {
  auto           f = MakeFixture(std::chrono::milliseconds(20));
  const LevelKey key{"part-1", "store-1"};
  f.ledger->InitializeLevel(key, 40, "admin");

  for (int round = 0; round < 4; ++round) {
    std::mutex               ids_mutex;
    std::vector<std::string> held;

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
      threads.emplace_back([&, round, i] {
        try {
          auto reservation = f.reservations->Reserve("req-" + std::to_string(round) + "-" + std::to_string(i), key, 2, "tech-1");
          std::lock_guard<std::mutex> lock(ids_mutex);
          held.push_back(reservation.id);
        } catch (const outflow::util::InsufficientStock&) {
        }
      });
    }
    for (auto& thread : threads)
      thread.join();
    AssertReservedWithinStock(*f.ledger, key);

    // Every hold is raced by a release, a consume and the expiry sweep; each
    // ends in exactly one terminal state.
    threads.clear();
    for (const auto& id : held) {
      threads.emplace_back([&, id] {
        try {
          f.reservations->Release(id, "cancelled");
        } catch (const outflow::util::InvalidTransition&) {
        }
      });
      threads.emplace_back([&, id] {
        try {
          f.reservations->Consume(id, IssueRef(id));
        } catch (const outflow::util::InvalidTransition&) {
        }
      });
    }
    threads.emplace_back([&] { f.reservations->ReleaseExpired(outflow::util::NowMs() + 60000); });
    for (auto& thread : threads)
      thread.join();
    AssertReservedWithinStock(*f.ledger, key);

    for (const auto& id : held) {
      assert(f.reservations->Get(id)->status != ReservationStatus::kActive);
    }
    assert(f.ledger->GetLevel(key)->reserved_stock == 0);
  }
}

} // namespace

int main() {
  TestReserveHoldsAvailableStockOnly();
  TestShortfallCarriesRequestContext();
  TestOneActiveReservationPerRequest();
  TestConsumeWritesSingleOutMovement();
  TestExpiredReservationIsReleasedNotConsumed();
  TestExtendMovesExpiryForward();
  TestConcurrentReservationsNeverExceedStock();
  TestConcurrentKeysRetryThroughConflicts();
  TestDisjointKeysNeverSeeStaleState();
  TestMixedReserveReleaseConsumeKeepInvariant();

  std::cout << "outflow_unit_reservation_concurrency: pass\n";
  return 0;
}
