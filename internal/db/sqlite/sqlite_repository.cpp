#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace routebid::db::sqlite {

using routebid::db::ErrorCode;
using routebid::db::Result;

namespace {

constexpr const char* kPackageColumns =
    "id,status,sender_id,description,size,weight_kg,"
    "pickup_lat,pickup_lng,pickup_address,dropoff_lat,dropoff_lng,dropoff_address,"
    "offered_price,selected_bid_id,courier_id,created_at_ms,status_changed_at_ms,"
    "bidding_deadline_ms,deadline_extension_count,deadline_warning_sent,"
    "delivery_proof_ref,failure_reason,version";

constexpr const char* kBidColumns =
    "id,package_id,courier_id,proposed_price,proposed_pickup_time_ms,message,status,created_at_ms,resolved_at_ms";

constexpr const char* kRouteColumns =
    "id,courier_id,start_lat,start_lng,start_address,end_lat,end_lng,end_address,"
    "max_deviation_km,trip_date_ms,is_active,created_at_ms";

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  int           rc = SQLITE_OK;

  Statement(sqlite3* db, const std::string& sql) {
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return rc == SQLITE_OK && st != nullptr;
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    BindDouble(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindI64(st, idx, util::ToUnixMillis(*tp));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return util::FromUnixMillis(ColI64(st, col));
}

// Binds every package column except version, starting at `idx`.
int BindPackageFields(sqlite3_stmt* st, int idx, const model::Package& p) {
  BindText(st, idx++, p.id);
  BindI64(st, idx++, static_cast<int64_t>(p.status));
  BindText(st, idx++, p.sender_id);
  BindText(st, idx++, p.description);
  BindI64(st, idx++, static_cast<int64_t>(p.size));
  BindDouble(st, idx++, p.weight_kg);
  BindDouble(st, idx++, p.pickup.lat);
  BindDouble(st, idx++, p.pickup.lng);
  BindText(st, idx++, p.pickup_address);
  BindDouble(st, idx++, p.dropoff.lat);
  BindDouble(st, idx++, p.dropoff.lng);
  BindText(st, idx++, p.dropoff_address);
  BindOptDouble(st, idx++, p.offered_price);
  BindOptText(st, idx++, p.selected_bid_id);
  BindOptText(st, idx++, p.courier_id);
  BindI64(st, idx++, util::ToUnixMillis(p.created_at));
  BindI64(st, idx++, util::ToUnixMillis(p.status_changed_at));
  BindOptTime(st, idx++, p.bidding_deadline);
  BindI64(st, idx++, p.deadline_extension_count);
  BindI64(st, idx++, p.deadline_warning_sent ? 1 : 0);
  BindText(st, idx++, p.delivery_proof_ref);
  BindText(st, idx++, p.failure_reason);
  return idx;
}

model::Package ReadPackage(sqlite3_stmt* st) {
  model::Package p;
  p.id                       = ColText(st, 0);
  p.status                   = static_cast<model::PackageStatus>(ColI64(st, 1));
  p.sender_id                = ColText(st, 2);
  p.description              = ColText(st, 3);
  p.size                     = static_cast<model::PackageSize>(ColI64(st, 4));
  p.weight_kg                = ColDouble(st, 5);
  p.pickup                   = {ColDouble(st, 6), ColDouble(st, 7)};
  p.pickup_address           = ColText(st, 8);
  p.dropoff                  = {ColDouble(st, 9), ColDouble(st, 10)};
  p.dropoff_address          = ColText(st, 11);
  p.offered_price            = IsNull(st, 12) ? std::nullopt : std::optional<double>(ColDouble(st, 12));
  p.selected_bid_id          = ColOptText(st, 13);
  p.courier_id               = ColOptText(st, 14);
  p.created_at               = util::FromUnixMillis(ColI64(st, 15));
  p.status_changed_at        = util::FromUnixMillis(ColI64(st, 16));
  p.bidding_deadline         = ColOptTime(st, 17);
  p.deadline_extension_count = static_cast<uint32_t>(ColI64(st, 18));
  p.deadline_warning_sent    = ColI64(st, 19) != 0;
  p.delivery_proof_ref       = ColText(st, 20);
  p.failure_reason           = ColText(st, 21);
  p.version                  = static_cast<uint64_t>(ColI64(st, 22));
  return p;
}

void BindBid(sqlite3_stmt* st, const model::Bid& b) {
  BindText(st, 1, b.id);
  BindText(st, 2, b.package_id);
  BindText(st, 3, b.courier_id);
  BindDouble(st, 4, b.proposed_price);
  BindOptTime(st, 5, b.proposed_pickup_time);
  BindText(st, 6, b.message);
  BindI64(st, 7, static_cast<int64_t>(b.status));
  BindI64(st, 8, util::ToUnixMillis(b.created_at));
  BindOptTime(st, 9, b.resolved_at);
}

model::Bid ReadBid(sqlite3_stmt* st) {
  model::Bid b;
  b.id                   = ColText(st, 0);
  b.package_id           = ColText(st, 1);
  b.courier_id           = ColText(st, 2);
  b.proposed_price       = ColDouble(st, 3);
  b.proposed_pickup_time = ColOptTime(st, 4);
  b.message              = ColText(st, 5);
  b.status               = static_cast<model::BidStatus>(ColI64(st, 6));
  b.created_at           = util::FromUnixMillis(ColI64(st, 7));
  b.resolved_at          = ColOptTime(st, 8);
  return b;
}

void BindRoute(sqlite3_stmt* st, const model::Route& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.courier_id);
  BindDouble(st, 3, r.start.lat);
  BindDouble(st, 4, r.start.lng);
  BindText(st, 5, r.start_address);
  BindDouble(st, 6, r.end.lat);
  BindDouble(st, 7, r.end.lng);
  BindText(st, 8, r.end_address);
  BindDouble(st, 9, r.max_deviation_km);
  BindOptTime(st, 10, r.trip_date);
  BindI64(st, 11, r.is_active ? 1 : 0);
  BindI64(st, 12, util::ToUnixMillis(r.created_at));
}

model::Route ReadRoute(sqlite3_stmt* st) {
  model::Route r;
  r.id               = ColText(st, 0);
  r.courier_id       = ColText(st, 1);
  r.start            = {ColDouble(st, 2), ColDouble(st, 3)};
  r.start_address    = ColText(st, 4);
  r.end              = {ColDouble(st, 5), ColDouble(st, 6)};
  r.end_address      = ColText(st, 7);
  r.max_deviation_km = ColDouble(st, 8);
  r.trip_date        = ColOptTime(st, 9);
  r.is_active        = ColI64(st, 10) != 0;
  r.created_at       = util::FromUnixMillis(ColI64(st, 11));
  return r;
}

template <typename T, typename Reader>
std::vector<T> ReadAll(Statement& stmt, Reader reader) {
  std::vector<T> out;
  while (sqlite3_step(stmt.st) == SQLITE_ROW) {
    out.push_back(reader(stmt.st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      std::string msg = sqlite3_errmsg(db);
      // bid_active_per_courier covers (package_id, courier_id)
      if (msg.find("bid.courier_id") != std::string::npos) {
        return Result::Err(ErrorCode::AlreadyExists, msg);
      }
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS package ("
      " id TEXT PRIMARY KEY, status INTEGER NOT NULL, sender_id TEXT NOT NULL, description TEXT NOT NULL,"
      " size INTEGER NOT NULL, weight_kg REAL NOT NULL,"
      " pickup_lat REAL NOT NULL, pickup_lng REAL NOT NULL, pickup_address TEXT NOT NULL,"
      " dropoff_lat REAL NOT NULL, dropoff_lng REAL NOT NULL, dropoff_address TEXT NOT NULL,"
      " offered_price REAL, selected_bid_id TEXT, courier_id TEXT,"
      " created_at_ms INTEGER NOT NULL, status_changed_at_ms INTEGER NOT NULL, bidding_deadline_ms INTEGER,"
      " deadline_extension_count INTEGER NOT NULL DEFAULT 0, deadline_warning_sent INTEGER NOT NULL DEFAULT 0,"
      " delivery_proof_ref TEXT NOT NULL DEFAULT '', failure_reason TEXT NOT NULL DEFAULT '',"
      " version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS package_status_idx ON package(status, bidding_deadline_ms);",
      "CREATE INDEX IF NOT EXISTS package_sender_idx ON package(sender_id);",
      "CREATE TABLE IF NOT EXISTS bid ("
      " id TEXT PRIMARY KEY, package_id TEXT NOT NULL REFERENCES package(id), courier_id TEXT NOT NULL,"
      " proposed_price REAL NOT NULL, proposed_pickup_time_ms INTEGER, message TEXT NOT NULL DEFAULT '',"
      " status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, resolved_at_ms INTEGER);",
      "CREATE UNIQUE INDEX IF NOT EXISTS bid_active_per_courier ON bid(package_id, courier_id) WHERE status IN (1, 2);",
      "CREATE UNIQUE INDEX IF NOT EXISTS bid_selected_per_package ON bid(package_id) WHERE status = 2;",
      "CREATE INDEX IF NOT EXISTS bid_courier_idx ON bid(courier_id);",
      "CREATE TABLE IF NOT EXISTS route ("
      " id TEXT PRIMARY KEY, courier_id TEXT NOT NULL,"
      " start_lat REAL NOT NULL, start_lng REAL NOT NULL, start_address TEXT NOT NULL,"
      " end_lat REAL NOT NULL, end_lng REAL NOT NULL, end_address TEXT NOT NULL,"
      " max_deviation_km REAL NOT NULL, trip_date_ms INTEGER, is_active INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS route_active_per_courier ON route(courier_id) WHERE is_active = 1;"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

// ------------------------------------------------------------------
// Package
// ------------------------------------------------------------------

Result SqliteRepository::InsertPackage(Transaction& t, model::Package& p) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO package(") + kPackageColumns +
                         ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Translate(db, stmt.rc);

  const int next = BindPackageFields(stmt.st, 1, p);
  BindI64(stmt.st, next, 1);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (result) p.version = 1;
  return result;
}

std::optional<model::Package> SqliteRepository::GetPackage(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kPackageColumns + " FROM package WHERE id=?;");
  if (!stmt) return std::nullopt;
  BindText(stmt.st, 1, id);

  if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
  return ReadPackage(stmt.st);
}

std::vector<model::Package> SqliteRepository::ListPackages(Transaction& t, const PackageFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kPackageColumns + " FROM package WHERE 1=1";
  if (filter.status) sql += " AND status=?";
  if (filter.sender_id) sql += " AND sender_id=?";
  if (filter.courier_id) sql += " AND courier_id=?";
  sql += " ORDER BY created_at_ms, id";
  if (filter.limit > 0) sql += " LIMIT " + std::to_string(filter.limit);
  sql += ";";

  Statement stmt(db, sql);
  if (!stmt) return {};

  int idx = 1;
  if (filter.status) BindI64(stmt.st, idx++, static_cast<int64_t>(*filter.status));
  if (filter.sender_id) BindText(stmt.st, idx++, *filter.sender_id);
  if (filter.courier_id) BindText(stmt.st, idx++, *filter.courier_id);

  return ReadAll<model::Package>(stmt, ReadPackage);
}

Result SqliteRepository::UpdatePackage(Transaction& t, model::Package& p) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE package SET id=?,status=?,sender_id=?,description=?,size=?,weight_kg=?,"
                 "pickup_lat=?,pickup_lng=?,pickup_address=?,dropoff_lat=?,dropoff_lng=?,dropoff_address=?,"
                 "offered_price=?,selected_bid_id=?,courier_id=?,created_at_ms=?,status_changed_at_ms=?,"
                 "bidding_deadline_ms=?,deadline_extension_count=?,deadline_warning_sent=?,"
                 "delivery_proof_ref=?,failure_reason=?,version=version+1 WHERE id=? AND version=?;");
  if (!stmt) return Translate(db, stmt.rc);

  int idx = BindPackageFields(stmt.st, 1, p);
  BindText(stmt.st, idx++, p.id);
  BindI64(stmt.st, idx, static_cast<int64_t>(p.version));

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    Statement exists(db, "SELECT 1 FROM package WHERE id=?;");
    if (!exists) return Translate(db, exists.rc);
    BindText(exists.st, 1, p.id);
    if (sqlite3_step(exists.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "stale package version");
  }

  ++p.version;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Bid
// ------------------------------------------------------------------

Result SqliteRepository::InsertBid(Transaction& t, const model::Bid& b) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO bid(") + kBidColumns + ") VALUES(?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Translate(db, stmt.rc);
  BindBid(stmt.st, b);

  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::Bid> SqliteRepository::GetBid(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kBidColumns + " FROM bid WHERE id=?;");
  if (!stmt) return std::nullopt;
  BindText(stmt.st, 1, id);

  if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
  return ReadBid(stmt.st);
}

std::vector<model::Bid> SqliteRepository::ListBidsForPackage(Transaction& t, const std::string& package_id, const BidFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kBidColumns + " FROM bid WHERE package_id=?";
  if (filter.status) sql += " AND status=?";
  sql += " ORDER BY created_at_ms, id;";

  Statement stmt(db, sql);
  if (!stmt) return {};
  BindText(stmt.st, 1, package_id);
  if (filter.status) BindI64(stmt.st, 2, static_cast<int64_t>(*filter.status));

  return ReadAll<model::Bid>(stmt, ReadBid);
}

std::vector<model::Bid> SqliteRepository::ListBidsForCourier(Transaction& t, const std::string& courier_id, const BidFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kBidColumns + " FROM bid WHERE courier_id=?";
  if (filter.status) sql += " AND status=?";
  sql += " ORDER BY created_at_ms, id;";

  Statement stmt(db, sql);
  if (!stmt) return {};
  BindText(stmt.st, 1, courier_id);
  if (filter.status) BindI64(stmt.st, 2, static_cast<int64_t>(*filter.status));

  return ReadAll<model::Bid>(stmt, ReadBid);
}

Result SqliteRepository::UpdateBid(Transaction& t, const model::Bid& b) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE bid SET id=?,package_id=?,courier_id=?,proposed_price=?,proposed_pickup_time_ms=?,"
                 "message=?,status=?,created_at_ms=?,resolved_at_ms=? WHERE id=?;");
  if (!stmt) return Translate(db, stmt.rc);
  BindBid(stmt.st, b);
  BindText(stmt.st, 10, b.id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Route
// ------------------------------------------------------------------

Result SqliteRepository::InsertRoute(Transaction& t, const model::Route& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO route(") + kRouteColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Translate(db, stmt.rc);
  BindRoute(stmt.st, r);

  return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::Route> SqliteRepository::GetRoute(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRouteColumns + " FROM route WHERE id=?;");
  if (!stmt) return std::nullopt;
  BindText(stmt.st, 1, id);

  if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
  return ReadRoute(stmt.st);
}

std::vector<model::Route> SqliteRepository::ListRoutesForCourier(Transaction& t, const std::string& courier_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRouteColumns + " FROM route WHERE courier_id=? ORDER BY created_at_ms, id;");
  if (!stmt) return {};
  BindText(stmt.st, 1, courier_id);

  return ReadAll<model::Route>(stmt, ReadRoute);
}

std::vector<model::Route> SqliteRepository::ListActiveRoutes(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRouteColumns + " FROM route WHERE is_active=1 ORDER BY created_at_ms, id;");
  if (!stmt) return {};

  return ReadAll<model::Route>(stmt, ReadRoute);
}

Result SqliteRepository::UpdateRoute(Transaction& t, const model::Route& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE route SET id=?,courier_id=?,start_lat=?,start_lng=?,start_address=?,end_lat=?,end_lng=?,"
                 "end_address=?,max_deviation_km=?,trip_date_ms=?,is_active=?,created_at_ms=? WHERE id=?;");
  if (!stmt) return Translate(db, stmt.rc);
  BindRoute(stmt.st, r);
  BindText(stmt.st, 13, r.id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace routebid::db::sqlite
