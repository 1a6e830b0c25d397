#pragma once

#include <string>
#include <vector>

// Column lists shared by prepared statements and row readers.
#define ROUTEBID_PG_PACKAGE_COLUMNS                                                                              \
  "id,status,sender_id,description,size,weight_kg,"                                                            \
  "pickup_lat,pickup_lng,pickup_address,dropoff_lat,dropoff_lng,dropoff_address,"                              \
  "offered_price,selected_bid_id,courier_id,created_at_ms,status_changed_at_ms,"                               \
  "bidding_deadline_ms,deadline_extension_count,deadline_warning_sent,delivery_proof_ref,failure_reason,version"

#define ROUTEBID_PG_BID_COLUMNS \
  "id,package_id,courier_id,proposed_price,proposed_pickup_time_ms,message,status,created_at_ms,resolved_at_ms"

#define ROUTEBID_PG_ROUTE_COLUMNS                                                 \
  "id,courier_id,start_lat,start_lng,start_address,end_lat,end_lng,end_address," \
  "max_deviation_km,trip_date_ms,is_active,created_at_ms"

namespace routebid::db::postgres {

inline const std::vector<std::string>& BootstrapSql() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS package ("
      " id TEXT PRIMARY KEY, status SMALLINT NOT NULL, sender_id TEXT NOT NULL, description TEXT NOT NULL,"
      " size SMALLINT NOT NULL, weight_kg DOUBLE PRECISION NOT NULL,"
      " pickup_lat DOUBLE PRECISION NOT NULL, pickup_lng DOUBLE PRECISION NOT NULL, pickup_address TEXT NOT NULL,"
      " dropoff_lat DOUBLE PRECISION NOT NULL, dropoff_lng DOUBLE PRECISION NOT NULL, dropoff_address TEXT NOT NULL,"
      " offered_price DOUBLE PRECISION, selected_bid_id TEXT, courier_id TEXT,"
      " created_at_ms BIGINT NOT NULL, status_changed_at_ms BIGINT NOT NULL, bidding_deadline_ms BIGINT,"
      " deadline_extension_count INTEGER NOT NULL DEFAULT 0, deadline_warning_sent BOOLEAN NOT NULL DEFAULT FALSE,"
      " delivery_proof_ref TEXT NOT NULL DEFAULT '', failure_reason TEXT NOT NULL DEFAULT '',"
      " version BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS package_status_idx ON package(status, bidding_deadline_ms);",
      "CREATE INDEX IF NOT EXISTS package_sender_idx ON package(sender_id);",
      "CREATE TABLE IF NOT EXISTS bid ("
      " id TEXT PRIMARY KEY, package_id TEXT NOT NULL REFERENCES package(id), courier_id TEXT NOT NULL,"
      " proposed_price DOUBLE PRECISION NOT NULL, proposed_pickup_time_ms BIGINT, message TEXT NOT NULL DEFAULT '',"
      " status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, resolved_at_ms BIGINT);",
      "CREATE UNIQUE INDEX IF NOT EXISTS bid_active_per_courier ON bid(package_id, courier_id) WHERE status IN (1, 2);",
      "CREATE UNIQUE INDEX IF NOT EXISTS bid_selected_per_package ON bid(package_id) WHERE status = 2;",
      "CREATE INDEX IF NOT EXISTS bid_courier_idx ON bid(courier_id);",
      "CREATE TABLE IF NOT EXISTS route ("
      " id TEXT PRIMARY KEY, courier_id TEXT NOT NULL,"
      " start_lat DOUBLE PRECISION NOT NULL, start_lng DOUBLE PRECISION NOT NULL, start_address TEXT NOT NULL,"
      " end_lat DOUBLE PRECISION NOT NULL, end_lng DOUBLE PRECISION NOT NULL, end_address TEXT NOT NULL,"
      " max_deviation_km DOUBLE PRECISION NOT NULL, trip_date_ms BIGINT, is_active BOOLEAN NOT NULL,"
      " created_at_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS route_active_per_courier ON route(courier_id) WHERE is_active;"};
  return kBootstrapSql;
}

} // namespace routebid::db::postgres
