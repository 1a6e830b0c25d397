#include "internal/events/domain_event.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace routebid::events {

std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kPackageStatusChanged:
      return "PackageStatusChanged";
    case EventKind::kBidPlaced:
      return "BidPlaced";
    case EventKind::kBidWithdrawn:
      return "BidWithdrawn";
    case EventKind::kBidSelected:
      return "BidSelected";
    case EventKind::kBidRejected:
      return "BidRejected";
    case EventKind::kBidExpired:
      return "BidExpired";
    case EventKind::kBidDeadlineExtended:
      return "BidDeadlineExtended";
    case EventKind::kBiddingReset:
      return "BiddingReset";
    case EventKind::kBidDeadlineWarning:
      return "BidDeadlineWarning";
  }
  return "Unknown";
}

void LoggingEventSink::Publish(const DomainEvent& event) {
  using observability::StringField;

  const auto from = event.from_status ? model::ToString(*event.from_status) : std::string_view{"-"};
  const auto to   = event.to_status ? model::ToString(*event.to_status) : std::string_view{"-"};

  ROUTEBID_LOG_INFO("domain event", {StringField("kind", ToString(event.kind)),
                                      StringField("package_id", event.package_id),
                                      StringField("bid_id", event.bid_id.empty() ? "-" : event.bid_id),
                                      StringField("courier_id", event.courier_id.empty() ? "-" : event.courier_id),
                                      StringField("from", from),
                                      StringField("to", to),
                                      observability::IntField("at_ms", util::ToUnixMillis(event.occurred_at)),
                                      StringField("detail", event.detail)});
}

void PublishAll(EventSink& sink, const std::vector<DomainEvent>& events) {
  for (const auto& event : events) {
    try {
      sink.Publish(event);
      observability::Metrics::Instance().RecordDomainEvent(ToString(event.kind));
    } catch (const std::exception& e) {
      ROUTEBID_LOG_ERROR("event sink publish failed", {observability::StringField("kind", ToString(event.kind)),
                                                        observability::StringField("package_id", event.package_id),
                                                        observability::StringField("error", e.what())});
    }
  }
}

} // namespace routebid::events
