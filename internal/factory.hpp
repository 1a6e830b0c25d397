#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/bid/bid_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/deadline/deadline_scheduler.hpp"
#include "internal/identity/courier_eligibility.hpp"
#include "internal/lifecycle/package_lifecycle.hpp"
#include "internal/match/match_engine.hpp"
#include "internal/route/route_manager.hpp"
#include "internal/util/time.hpp"

namespace routebid::factory {

/*
  Application

  Owns every long-lived component. The scheduler is built but not started;
  the caller starts it once the server is up.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<identity::EligibilityRegistry> eligibility;
  std::shared_ptr<bid::BidLedger>                ledger;
  std::shared_ptr<lifecycle::PackageLifecycle>   lifecycle;
  std::shared_ptr<route::RouteManager>           routes;
  std::shared_ptr<match::MatchEngine>            matcher;
  std::shared_ptr<deadline::DeadlineScheduler>   scheduler;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// The only place that knows concrete storage types.
std::shared_ptr<db::Repository> BuildRepository(const routebid::runtime::config::RuntimeConfig& config);

// Composition root.
Application Build(const routebid::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<const util::Clock>              clock = std::make_shared<util::SystemClock>());

} // namespace routebid::factory
