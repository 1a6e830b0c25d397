#include "pg_pool.hpp"

#include "pg_schema.hpp"

namespace routebid::db::postgres {

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
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
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
  conn.prepare("insert_package",
               "INSERT INTO package(" ROUTEBID_PG_PACKAGE_COLUMNS ") "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,1)");

  conn.prepare("get_package", "SELECT " ROUTEBID_PG_PACKAGE_COLUMNS " FROM package WHERE id=$1");

  conn.prepare("update_package",
               "UPDATE package SET status=$2,sender_id=$3,description=$4,size=$5,weight_kg=$6,"
               "pickup_lat=$7,pickup_lng=$8,pickup_address=$9,dropoff_lat=$10,dropoff_lng=$11,dropoff_address=$12,"
               "offered_price=$13,selected_bid_id=$14,courier_id=$15,created_at_ms=$16,status_changed_at_ms=$17,"
               "bidding_deadline_ms=$18,deadline_extension_count=$19,deadline_warning_sent=$20,"
               "delivery_proof_ref=$21,failure_reason=$22,version=version+1 WHERE id=$1 AND version=$23");

  conn.prepare("insert_bid", "INSERT INTO bid(" ROUTEBID_PG_BID_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_bid", "SELECT " ROUTEBID_PG_BID_COLUMNS " FROM bid WHERE id=$1");

  conn.prepare("update_bid",
               "UPDATE bid SET package_id=$2,courier_id=$3,proposed_price=$4,proposed_pickup_time_ms=$5,"
               "message=$6,status=$7,created_at_ms=$8,resolved_at_ms=$9 WHERE id=$1");

  conn.prepare("insert_route", "INSERT INTO route(" ROUTEBID_PG_ROUTE_COLUMNS ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");

  conn.prepare("get_route", "SELECT " ROUTEBID_PG_ROUTE_COLUMNS " FROM route WHERE id=$1");

  conn.prepare("list_routes_for_courier", "SELECT " ROUTEBID_PG_ROUTE_COLUMNS " FROM route WHERE courier_id=$1 ORDER BY created_at_ms, id");
  conn.prepare("list_active_routes", "SELECT " ROUTEBID_PG_ROUTE_COLUMNS " FROM route WHERE is_active ORDER BY created_at_ms, id");

  conn.prepare("update_route",
               "UPDATE route SET courier_id=$2,start_lat=$3,start_lng=$4,start_address=$5,end_lat=$6,end_lng=$7,"
               "end_address=$8,max_deviation_km=$9,trip_date_ms=$10,is_active=$11,created_at_ms=$12 WHERE id=$1");
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

} // namespace routebid::db::postgres
