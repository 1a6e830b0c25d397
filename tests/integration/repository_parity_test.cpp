#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/harness.hpp"

#if ROUTEBID_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROUTEBID_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using routebid::db::BidFilter;
using routebid::db::ErrorCode;
using routebid::db::PackageFilter;
using routebid::db::Repository;
using routebid::db::memory::MemoryRepository;
using routebid::model::Bid;
using routebid::model::BidStatus;
using routebid::model::Package;
using routebid::model::PackageStatus;
using routebid::model::Route;
using routebid::testing::Epoch;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

Package MakePackage(const std::string& id, const std::string& sender, int offset_s) {
  Package pkg;
  pkg.id                = id;
  pkg.status            = PackageStatus::kOpenForBids;
  pkg.sender_id         = sender;
  pkg.description       = "parcel";
  pkg.size              = routebid::model::PackageSize::kLarge;
  pkg.weight_kg         = 12.5;
  pkg.pickup            = {48.8566, 2.3522};
  pkg.pickup_address    = "rue de rivoli";
  pkg.dropoff           = {48.8049, 2.1204};
  pkg.dropoff_address   = "versailles";
  pkg.created_at        = Epoch() + std::chrono::seconds(offset_s);
  pkg.status_changed_at = pkg.created_at;
  pkg.bidding_deadline  = pkg.created_at + std::chrono::hours(24);
  return pkg;
}

Bid MakeBid(const std::string& id, const std::string& package_id, const std::string& courier, BidStatus status, int offset_s = 0) {
  Bid bid;
  bid.id             = id;
  bid.package_id     = package_id;
  bid.courier_id     = courier;
  bid.proposed_price = 17.25;
  bid.message        = "after work";
  bid.status         = status;
  bid.created_at     = Epoch() + std::chrono::seconds(offset_s);
  return bid;
}

void VerifyPackageReadWrite(Repository& repo, const std::string& id) {
  auto pkg          = MakePackage(id, id + "-sender", 0);
  pkg.offered_price = 40.0;
  {
    auto tx = repo.Begin();
    assert(repo.InsertPackage(*tx, pkg));
    assert(pkg.version == 1);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetPackage(*tx, id);
  assert(stored.has_value());
  assert(stored->status == PackageStatus::kOpenForBids);
  assert(stored->size == routebid::model::PackageSize::kLarge);
  assert(stored->weight_kg == 12.5);
  assert(stored->pickup.lat == 48.8566);
  assert(stored->dropoff_address == "versailles");
  assert(stored->offered_price == 40.0);
  assert(!stored->selected_bid_id.has_value());
  assert(stored->created_at == pkg.created_at);
  assert(stored->bidding_deadline == pkg.bidding_deadline);
  assert(stored->version == 1);

  stored->status                   = PackageStatus::kBidSelected;
  stored->selected_bid_id          = id + "-bid";
  stored->courier_id               = id + "-courier";
  stored->bidding_deadline         = std::nullopt;
  stored->deadline_extension_count = 2;
  stored->deadline_warning_sent    = true;
  assert(repo.UpdatePackage(*tx, *stored));
  assert(stored->version == 2);

  auto stale    = *stored;
  stale.version = 1;
  assert(repo.UpdatePackage(*tx, stale).code == ErrorCode::Conflict);

  auto missing = MakePackage(id + "-missing", "nobody", 0);
  assert(repo.UpdatePackage(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();

  auto verify = repo.Begin();
  auto final  = repo.GetPackage(*verify, id);
  assert(final->status == PackageStatus::kBidSelected);
  assert(final->selected_bid_id == id + "-bid");
  assert(final->courier_id == id + "-courier");
  assert(!final->bidding_deadline.has_value());
  assert(final->deadline_extension_count == 2);
  assert(final->deadline_warning_sent);
  assert(final->version == 2);
  verify->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx  = repo.Begin();
    auto pkg = MakePackage(id, id + "-sender", 0);
    assert(repo.InsertPackage(*tx, pkg));
    tx->Rollback();
  }
  {
    auto tx  = repo.Begin();
    auto pkg = MakePackage(id, id + "-sender", 0);
    assert(repo.InsertPackage(*tx, pkg));
  }

  auto tx = repo.Begin();
  assert(!repo.GetPackage(*tx, id).has_value());
  tx->Commit();
}

void VerifyBidRules(Repository& repo, const std::string& id) {
  const auto c1 = id + "-c1";
  const auto c2 = id + "-c2";

  // A rejected write ends its transaction; Postgres aborts the whole unit.
  {
    auto tx  = repo.Begin();
    auto pkg = MakePackage(id, id + "-sender", 0);
    assert(repo.InsertPackage(*tx, pkg));
    assert(repo.InsertBid(*tx, MakeBid(id + "-b1", id, c1, BidStatus::kPending, 1)));
    assert(repo.InsertBid(*tx, MakeBid(id + "-b3", id, c2, BidStatus::kPending, 3)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertBid(*tx, MakeBid(id + "-b2", id, c1, BidStatus::kPending, 2)).code == ErrorCode::AlreadyExists);
  }

  auto selected        = MakeBid(id + "-b1", id, c1, BidStatus::kSelected, 1);
  selected.resolved_at = Epoch() + std::chrono::hours(1);
  {
    auto tx = repo.Begin();
    assert(repo.UpdateBid(*tx, selected));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpdateBid(*tx, MakeBid(id + "-b3", id, c2, BidStatus::kSelected, 3)).code == ErrorCode::ConstraintViolation);
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpdateBid(*tx, MakeBid(id + "-b3", id, c2, BidStatus::kRejected, 3)));
    assert(repo.InsertBid(*tx, MakeBid(id + "-b4", id, c2, BidStatus::kPending, 4)));
    tx->Commit();
  }

  auto verify = repo.Begin();
  const auto all = repo.ListBidsForPackage(*verify, id, BidFilter{});
  assert(all.size() == 3);
  assert(all[0].id == id + "-b1");
  assert(all[0].status == BidStatus::kSelected);
  assert(all[0].resolved_at == selected.resolved_at);
  assert(all[0].message == "after work");
  assert(all[1].id == id + "-b3");
  assert(all[2].id == id + "-b4");

  assert(repo.ListBidsForPackage(*verify, id, BidFilter{BidStatus::kPending}).size() == 1);
  assert(repo.ListBidsForCourier(*verify, c2, BidFilter{}).size() == 2);
  assert(repo.ListBidsForCourier(*verify, c2, BidFilter{BidStatus::kRejected}).size() == 1);
  assert(!repo.GetBid(*verify, id + "-missing").has_value());
  verify->Commit();
}

void VerifyPackageListing(Repository& repo, const std::string& id) {
  const auto sender = id + "-sender";
  {
    auto tx     = repo.Begin();
    auto late   = MakePackage(id + "-a", sender, 30);
    auto early  = MakePackage(id + "-z", sender, 10);
    auto closed = MakePackage(id + "-m", sender, 20);
    closed.status = PackageStatus::kDelivered;
    early.courier_id = id + "-carrier";
    assert(repo.InsertPackage(*tx, late));
    assert(repo.InsertPackage(*tx, early));
    assert(repo.InsertPackage(*tx, closed));
    tx->Commit();
  }

  auto tx = repo.Begin();

  PackageFilter mine;
  mine.sender_id = sender;
  const auto all = repo.ListPackages(*tx, mine);
  assert(all.size() == 3);
  assert(all[0].id == id + "-z");
  assert(all[1].id == id + "-m");
  assert(all[2].id == id + "-a");

  mine.status = PackageStatus::kOpenForBids;
  assert(repo.ListPackages(*tx, mine).size() == 2);

  mine.limit = 1;
  const auto first = repo.ListPackages(*tx, mine);
  assert(first.size() == 1);
  assert(first[0].id == id + "-z");

  PackageFilter carried;
  carried.courier_id = id + "-carrier";
  const auto by_courier = repo.ListPackages(*tx, carried);
  assert(by_courier.size() == 1);
  assert(by_courier[0].id == id + "-z");
  tx->Commit();
}

void VerifyRouteReadWrite(Repository& repo, const std::string& id) {
  const auto courier = id + "-courier";

  Route first;
  first.id               = id + "-r1";
  first.courier_id       = courier;
  first.start            = {51.5074, -0.1278};
  first.start_address    = "london";
  first.end              = {51.7520, -1.2577};
  first.end_address      = "oxford";
  first.max_deviation_km = 7.5;
  first.is_active        = true;
  first.created_at       = Epoch();

  auto second       = first;
  second.id         = id + "-r2";
  second.trip_date  = Epoch() + std::chrono::hours(72);
  second.created_at = Epoch() + std::chrono::minutes(1);

  {
    auto tx = repo.Begin();
    assert(repo.InsertRoute(*tx, first));
    first.is_active = false;
    assert(repo.UpdateRoute(*tx, first));
    assert(repo.InsertRoute(*tx, second));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto routes = repo.ListRoutesForCourier(*tx, courier);
  assert(routes.size() == 2);
  assert(routes[0].id == first.id);
  assert(!routes[0].is_active);
  assert(!routes[0].trip_date.has_value());
  assert(routes[1].is_active);
  assert(routes[1].trip_date == second.trip_date);
  assert(routes[1].max_deviation_km == 7.5);

  bool saw_active = false;
  for (const auto& route : repo.ListActiveRoutes(*tx)) {
    assert(route.is_active);
    assert(route.id != first.id);
    saw_active = saw_active || route.id == second.id;
  }
  assert(saw_active);

  auto ghost = first;
  ghost.id   = id + "-ghost";
  assert(repo.UpdateRoute(*tx, ghost).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  {
    auto tx  = repo.Begin();
    auto pkg = MakePackage(id, id + "-sender", 0);
    assert(repo.InsertPackage(*tx, pkg));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetPackage(*tx1, id);
  auto r2 = repo.GetPackage(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->description = "first";
  r2->description = "second";

  assert(repo.UpdatePackage(*tx1, *r1));
  tx1->Commit();

  // The loser fails either at the compare-and-swap or at commit.
  bool conflicted = false;
  try {
    const auto result = repo.UpdatePackage(*tx2, *r2);
    if (result.code == ErrorCode::Conflict) {
      conflicted = true;
    } else {
      tx2->Commit();
    }
  } catch (const routebid::util::Conflict&) {
    conflicted = true;
  }
  assert(conflicted);
  tx2.reset();

  auto verify = repo.Begin();
  auto final  = repo.GetPackage(*verify, id);
  assert(final->description == "first");
  assert(final->version == 2);
  verify->Commit();
}

void VerifyDomainFlow(std::shared_ptr<Repository> repo, const std::string& id) {
  routebid::testing::Harness h(std::move(repo));
  const auto                 sender = id + "-sender";

  const auto pkg   = h.lifecycle->CreatePackage(routebid::testing::MakeDraft(sender));
  const auto cheap = h.ledger->PlaceBid(routebid::testing::MakeBid(pkg.id, id + "-c1", 12.0));
  const auto dear  = h.ledger->PlaceBid(routebid::testing::MakeBid(pkg.id, id + "-c2", 19.0));

  h.ledger->SelectBid(cheap.id, sender);
  assert(h.ledger->GetBid(cheap.id).status == BidStatus::kSelected);
  assert(h.ledger->GetBid(dear.id).status == BidStatus::kRejected);

  h.lifecycle->ConfirmPickupIntent(pkg.id, id + "-c1");
  h.lifecycle->ConfirmPickup(pkg.id, id + "-c1");
  const auto delivered = h.lifecycle->MarkDelivered(pkg.id, "proof");
  assert(delivered.status == PackageStatus::kDelivered);
  assert(h.lifecycle->GetPackage(pkg.id).version == delivered.version);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto pkg = MakePackage(id, id + "-sender", 0);
    assert(repo->InsertPackage(*tx, pkg));
    assert(repo->InsertBid(*tx, MakeBid(id + "-bid", id, id + "-courier", BidStatus::kPending)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetPackage(*tx, id);
  assert(p.has_value());
  assert(p->version == 1);
  assert(repo->GetBid(*tx, id + "-bid")->courier_id == id + "-courier");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ROUTEBID_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("routebid_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<routebid::db::sqlite::SqliteDB>(db_path);
    routebid::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<routebid::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      // A transaction holds the connection until it finishes.
      .supports_parallel_transactions = false,
  };
}
#endif

#if ROUTEBID_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ROUTEBID_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ROUTEBID_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    routebid::db::postgres::PgRepository::BootstrapSchema(conninfo);
    return std::make_shared<routebid::db::postgres::PgRepository>(std::make_shared<routebid::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // Postgres keeps rows between runs; keep ids unique.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    VerifyPackageReadWrite(*repo, prefix + "-package");
    VerifyRollbackBehavior(*repo, prefix + "-rollback");
    VerifyBidRules(*repo, prefix + "-bids");
    VerifyPackageListing(*repo, prefix + "-listing");
    VerifyRouteReadWrite(*repo, prefix + "-routes");
    VerifyConcurrentUpdates(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);
    VerifyDomainFlow(repo, prefix + "-flow");
  }

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROUTEBID_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ROUTEBID_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "routebid_integration_repository_parity: pass\n";
  return 0;
}
