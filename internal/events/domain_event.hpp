#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/package_status.hpp"
#include "internal/util/time.hpp"

namespace routebid::events {

enum class EventKind {
  kPackageStatusChanged,
  kBidPlaced,
  kBidWithdrawn,
  kBidSelected,
  kBidRejected,
  kBidExpired,
  kBidDeadlineExtended,
  kBiddingReset,
  kBidDeadlineWarning,
};

std::string_view ToString(EventKind kind);

struct DomainEvent {
  EventKind   kind = EventKind::kPackageStatusChanged;
  std::string package_id;
  std::string bid_id;
  std::string courier_id;
  std::string sender_id;

  std::optional<model::PackageStatus> from_status;
  std::optional<model::PackageStatus> to_status;

  util::TimePoint occurred_at{};
  std::string     detail;
};

/*
  Outbound domain events.

  Publish() is called after the owning transaction committed, while the
  package lock is still held, so per-package delivery order matches the
  order of transitions. Notification fan-out lives behind this interface.
*/
class EventSink {
 public:
  virtual ~EventSink()                          = default;
  virtual void Publish(const DomainEvent& event) = 0;
};

// Writes every event as a structured log line.
class LoggingEventSink final : public EventSink {
 public:
  void Publish(const DomainEvent& event) override;
};

// Publishes in order; a failing sink is logged and does not stop delivery.
void PublishAll(EventSink& sink, const std::vector<DomainEvent>& events);

} // namespace routebid::events
