#include "pg_repository.hpp"

#include <optional>
#include <string>

#include "pg_schema.hpp"

namespace routebid::db::postgres {

namespace {

std::optional<int64_t> ToMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

std::optional<util::TimePoint> OptTime(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return util::FromUnixMillis(f.as<int64_t>());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::Package ReadPackage(const pqxx::row& row) {
  model::Package p;
  p.id                       = row[0].c_str();
  p.status                   = static_cast<model::PackageStatus>(row[1].as<int>());
  p.sender_id                = row[2].c_str();
  p.description              = row[3].c_str();
  p.size                     = static_cast<model::PackageSize>(row[4].as<int>());
  p.weight_kg                = row[5].as<double>();
  p.pickup                   = {row[6].as<double>(), row[7].as<double>()};
  p.pickup_address           = row[8].c_str();
  p.dropoff                  = {row[9].as<double>(), row[10].as<double>()};
  p.dropoff_address          = row[11].c_str();
  p.offered_price            = row[12].is_null() ? std::nullopt : std::optional<double>(row[12].as<double>());
  p.selected_bid_id          = OptText(row[13]);
  p.courier_id               = OptText(row[14]);
  p.created_at               = util::FromUnixMillis(row[15].as<int64_t>());
  p.status_changed_at        = util::FromUnixMillis(row[16].as<int64_t>());
  p.bidding_deadline         = OptTime(row[17]);
  p.deadline_extension_count = row[18].as<uint32_t>();
  p.deadline_warning_sent    = row[19].as<bool>();
  p.delivery_proof_ref       = row[20].c_str();
  p.failure_reason           = row[21].c_str();
  p.version                  = row[22].as<uint64_t>();
  return p;
}

model::Bid ReadBid(const pqxx::row& row) {
  model::Bid b;
  b.id                   = row[0].c_str();
  b.package_id           = row[1].c_str();
  b.courier_id           = row[2].c_str();
  b.proposed_price       = row[3].as<double>();
  b.proposed_pickup_time = OptTime(row[4]);
  b.message              = row[5].c_str();
  b.status               = static_cast<model::BidStatus>(row[6].as<int>());
  b.created_at           = util::FromUnixMillis(row[7].as<int64_t>());
  b.resolved_at          = OptTime(row[8]);
  return b;
}

model::Route ReadRoute(const pqxx::row& row) {
  model::Route r;
  r.id               = row[0].c_str();
  r.courier_id       = row[1].c_str();
  r.start            = {row[2].as<double>(), row[3].as<double>()};
  r.start_address    = row[4].c_str();
  r.end              = {row[5].as<double>(), row[6].as<double>()};
  r.end_address      = row[7].c_str();
  r.max_deviation_km = row[8].as<double>();
  r.trip_date        = OptTime(row[9]);
  r.is_active        = row[10].as<bool>();
  r.created_at       = util::FromUnixMillis(row[11].as<int64_t>());
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* unique = dynamic_cast<const pqxx::unique_violation*>(&e)) {
    const std::string msg = unique->what();
    if (msg.find("bid_active_per_courier") != std::string::npos) {
      return Result::Err(ErrorCode::AlreadyExists, msg);
    }
    return Result::Err(ErrorCode::ConstraintViolation, msg);
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::BootstrapSchema(const std::string& conninfo) {
  // Pooled connections prepare statements against these tables, so the
  // schema is created over a plain connection first.
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  for (const auto& sql : BootstrapSql()) {
    tx.exec(sql);
  }
  tx.commit();
}

// ------------------------------------------------------------------
// Package
// ------------------------------------------------------------------

Result PgRepository::InsertPackage(Transaction& t, model::Package& p) {
  try {
    TX(t).Work().exec_prepared("insert_package", p.id, static_cast<int>(p.status), p.sender_id, p.description, static_cast<int>(p.size),
                               p.weight_kg, p.pickup.lat, p.pickup.lng, p.pickup_address, p.dropoff.lat, p.dropoff.lng,
                               p.dropoff_address, p.offered_price, p.selected_bid_id, p.courier_id, util::ToUnixMillis(p.created_at),
                               util::ToUnixMillis(p.status_changed_at), ToMillis(p.bidding_deadline),
                               static_cast<int64_t>(p.deadline_extension_count), p.deadline_warning_sent, p.delivery_proof_ref,
                               p.failure_reason);
    p.version = 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Package> PgRepository::GetPackage(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_package", id);
  if (res.empty()) return std::nullopt;
  return ReadPackage(res[0]);
}

std::vector<model::Package> PgRepository::ListPackages(Transaction& t, const PackageFilter& filter) {
  auto&       work = TX(t).Work();
  std::string sql  = "SELECT " ROUTEBID_PG_PACKAGE_COLUMNS " FROM package WHERE TRUE";
  if (filter.status) sql += " AND status=" + work.quote(static_cast<int>(*filter.status));
  if (filter.sender_id) sql += " AND sender_id=" + work.quote(*filter.sender_id);
  if (filter.courier_id) sql += " AND courier_id=" + work.quote(*filter.courier_id);
  sql += " ORDER BY created_at_ms, id";
  if (filter.limit > 0) sql += " LIMIT " + std::to_string(filter.limit);

  std::vector<model::Package> out;
  for (const auto& row : work.exec(sql)) {
    out.push_back(ReadPackage(row));
  }
  return out;
}

Result PgRepository::UpdatePackage(Transaction& t, model::Package& p) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_package", p.id, static_cast<int>(p.status), p.sender_id, p.description, static_cast<int>(p.size), p.weight_kg,
        p.pickup.lat, p.pickup.lng, p.pickup_address, p.dropoff.lat, p.dropoff.lng, p.dropoff_address, p.offered_price,
        p.selected_bid_id, p.courier_id, util::ToUnixMillis(p.created_at), util::ToUnixMillis(p.status_changed_at),
        ToMillis(p.bidding_deadline), static_cast<int64_t>(p.deadline_extension_count), p.deadline_warning_sent,
        p.delivery_proof_ref, p.failure_reason, static_cast<int64_t>(p.version));

    if (res.affected_rows() == 0) {
      if (!GetPackage(t, p.id)) return Result::Err(ErrorCode::NotFound);
      return Result::Err(ErrorCode::Conflict, "stale package version");
    }
    ++p.version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Bid
// ------------------------------------------------------------------

Result PgRepository::InsertBid(Transaction& t, const model::Bid& b) {
  try {
    TX(t).Work().exec_prepared("insert_bid", b.id, b.package_id, b.courier_id, b.proposed_price, ToMillis(b.proposed_pickup_time),
                               b.message, static_cast<int>(b.status), util::ToUnixMillis(b.created_at), ToMillis(b.resolved_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Bid> PgRepository::GetBid(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_bid", id);
  if (res.empty()) return std::nullopt;
  return ReadBid(res[0]);
}

std::vector<model::Bid> PgRepository::ListBidsForPackage(Transaction& t, const std::string& package_id, const BidFilter& filter) {
  auto&       work = TX(t).Work();
  std::string sql  = "SELECT " ROUTEBID_PG_BID_COLUMNS " FROM bid WHERE package_id=" + work.quote(package_id);
  if (filter.status) sql += " AND status=" + work.quote(static_cast<int>(*filter.status));
  sql += " ORDER BY created_at_ms, id";

  std::vector<model::Bid> out;
  for (const auto& row : work.exec(sql)) {
    out.push_back(ReadBid(row));
  }
  return out;
}

std::vector<model::Bid> PgRepository::ListBidsForCourier(Transaction& t, const std::string& courier_id, const BidFilter& filter) {
  auto&       work = TX(t).Work();
  std::string sql  = "SELECT " ROUTEBID_PG_BID_COLUMNS " FROM bid WHERE courier_id=" + work.quote(courier_id);
  if (filter.status) sql += " AND status=" + work.quote(static_cast<int>(*filter.status));
  sql += " ORDER BY created_at_ms, id";

  std::vector<model::Bid> out;
  for (const auto& row : work.exec(sql)) {
    out.push_back(ReadBid(row));
  }
  return out;
}

Result PgRepository::UpdateBid(Transaction& t, const model::Bid& b) {
  try {
    auto res = TX(t).Work().exec_prepared("update_bid", b.id, b.package_id, b.courier_id, b.proposed_price,
                                          ToMillis(b.proposed_pickup_time), b.message, static_cast<int>(b.status),
                                          util::ToUnixMillis(b.created_at), ToMillis(b.resolved_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Route
// ------------------------------------------------------------------

Result PgRepository::InsertRoute(Transaction& t, const model::Route& r) {
  try {
    TX(t).Work().exec_prepared("insert_route", r.id, r.courier_id, r.start.lat, r.start.lng, r.start_address, r.end.lat, r.end.lng,
                               r.end_address, r.max_deviation_km, ToMillis(r.trip_date), r.is_active, util::ToUnixMillis(r.created_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Route> PgRepository::GetRoute(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_route", id);
  if (res.empty()) return std::nullopt;
  return ReadRoute(res[0]);
}

std::vector<model::Route> PgRepository::ListRoutesForCourier(Transaction& t, const std::string& courier_id) {
  std::vector<model::Route> out;
  for (const auto& row : TX(t).Work().exec_prepared("list_routes_for_courier", courier_id)) {
    out.push_back(ReadRoute(row));
  }
  return out;
}

std::vector<model::Route> PgRepository::ListActiveRoutes(Transaction& t) {
  std::vector<model::Route> out;
  for (const auto& row : TX(t).Work().exec_prepared("list_active_routes")) {
    out.push_back(ReadRoute(row));
  }
  return out;
}

Result PgRepository::UpdateRoute(Transaction& t, const model::Route& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_route", r.id, r.courier_id, r.start.lat, r.start.lng, r.start_address, r.end.lat,
                                          r.end.lng, r.end_address, r.max_deviation_km, ToMillis(r.trip_date), r.is_active,
                                          util::ToUnixMillis(r.created_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace routebid::db::postgres
