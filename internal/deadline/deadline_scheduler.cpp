#include "internal/deadline/deadline_scheduler.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace routebid::deadline {

using observability::IntField;
using observability::StringField;

DeadlineScheduler::DeadlineScheduler(std::shared_ptr<lifecycle::PackageLifecycle> lifecycle,
                                     std::shared_ptr<route::RouteManager>         routes,
                                     std::chrono::milliseconds                    interval)
    : lifecycle_(std::move(lifecycle)), routes_(std::move(routes)), interval_(interval) {
}

DeadlineScheduler::~DeadlineScheduler() {
  Stop();
}

void DeadlineScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&DeadlineScheduler::Run, this);
  ROUTEBID_LOG_INFO("deadline scheduler started", {IntField("interval_ms", interval_.count())});
}

void DeadlineScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false) && !thread_.joinable()) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    ROUTEBID_LOG_INFO("deadline scheduler stopped");
  }
}

void DeadlineScheduler::Run() {
  while (running_) {
    try {
      Sweep(true);
    } catch (const std::exception& e) {
      ROUTEBID_LOG_ERROR("deadline sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

SweepReport DeadlineScheduler::SweepOnce() {
  return Sweep(false);
}

SweepReport DeadlineScheduler::Sweep(bool stop_on_shutdown) {
  observability::SpanScope span("DeadlineSweep");
  const auto               started = std::chrono::steady_clock::now();

  db::PackageFilter filter;
  filter.status = model::PackageStatus::kOpenForBids;

  SweepReport report;
  bool        interrupted = false;
  for (const auto& pkg : lifecycle_->ListPackages(filter)) {
    if (stop_on_shutdown && !running_) {
      interrupted = true;
      break;
    }
    ++report.examined;
    try {
      const auto outcome = lifecycle_->ProcessDeadline(pkg.id);
      switch (outcome.action) {
        case lifecycle::DeadlineAction::kWarned:
          ++report.warned;
          break;
        case lifecycle::DeadlineAction::kExtended:
          ++report.extended;
          break;
        case lifecycle::DeadlineAction::kReset:
          ++report.reset;
          report.bids_expired += outcome.bids_expired;
          break;
        case lifecycle::DeadlineAction::kNone:
          break;
      }
    } catch (const std::exception& e) {
      ++report.failures;
      ROUTEBID_LOG_WARN("deadline processing failed", {StringField("package_id", pkg.id), StringField("error", e.what())});
    }
  }

  if (!interrupted) {
    const auto expiry           = routes_->ExpireRoutes();
    report.routes_expired       = expiry.routes_deactivated;
    report.route_bids_withdrawn = expiry.bids_withdrawn;
    report.failures += expiry.failures;
  }

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveSweepDurationMs(elapsed_ms);
  span.SetAttribute("examined", static_cast<std::int64_t>(report.examined));
  if (interrupted) {
    ROUTEBID_LOG_INFO("deadline sweep interrupted by shutdown", {IntField("examined", static_cast<int64_t>(report.examined))});
  }

  if (report.warned + report.extended + report.reset + report.failures + report.routes_expired > 0) {
    ROUTEBID_LOG_INFO("deadline sweep", {IntField("examined", static_cast<int64_t>(report.examined)),
                                         IntField("warned", static_cast<int64_t>(report.warned)),
                                         IntField("extended", static_cast<int64_t>(report.extended)),
                                         IntField("reset", static_cast<int64_t>(report.reset)),
                                         IntField("bids_expired", static_cast<int64_t>(report.bids_expired)),
                                         IntField("routes_expired", static_cast<int64_t>(report.routes_expired)),
                                         IntField("failures", static_cast<int64_t>(report.failures))});
  }
  return report;
}

} // namespace routebid::deadline
