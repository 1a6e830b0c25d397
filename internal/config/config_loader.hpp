#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/lifecycle/bidding_policy.hpp"
#include "internal/lock/keyed_lock_table.hpp"

namespace routebid::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static routebid::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static routebid::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Unset or zero fields fall back to the built-in defaults.
lifecycle::BiddingPolicy  ToBiddingPolicy(const routebid::runtime::config::RuntimeConfig& config);
lock::LockOptions         ToLockOptions(const routebid::runtime::config::RuntimeConfig& config);
std::chrono::milliseconds SweepInterval(const routebid::runtime::config::RuntimeConfig& config);

inline constexpr std::chrono::milliseconds kDefaultSweepInterval{std::chrono::seconds(60)};
inline constexpr const char*               kDefaultBindAddress = "0.0.0.0:50061";

} // namespace routebid::config
