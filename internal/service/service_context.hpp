#pragma once

#include <memory>

namespace routebid::lifecycle {
class PackageLifecycle;
}
namespace routebid::bid {
class BidLedger;
}
namespace routebid::route {
class RouteManager;
}
namespace routebid::match {
class MatchEngine;
}
namespace routebid::deadline {
class DeadlineScheduler;
}
namespace routebid::identity {
class EligibilityRegistry;
}

namespace routebid::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<lifecycle::PackageLifecycle>   lifecycle;
  std::shared_ptr<bid::BidLedger>                ledger;
  std::shared_ptr<route::RouteManager>           routes;
  std::shared_ptr<match::MatchEngine>            matcher;
  std::shared_ptr<deadline::DeadlineScheduler>   scheduler;
  std::shared_ptr<identity::EligibilityRegistry> eligibility;
};

} // namespace routebid::service
