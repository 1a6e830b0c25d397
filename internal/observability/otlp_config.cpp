#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

namespace routebid::observability {

OtlpConfig ToOtlpConfig(const routebid::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == routebid::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }
  return otlp_config;
}

} // namespace routebid::observability
