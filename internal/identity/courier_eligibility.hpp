#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace routebid::identity {

/*
  Answers whether a courier may bid. Identity verification itself happens
  elsewhere; this is the narrow query the ledger depends on.
*/
class CourierEligibility {
 public:
  virtual ~CourierEligibility()                                 = default;
  virtual bool IsEligible(const std::string& courier_id) const = 0;
};

// Everyone is eligible unless an operator blocked them.
class EligibilityRegistry final : public CourierEligibility {
 public:
  bool IsEligible(const std::string& courier_id) const override;

  void SetEligible(const std::string& courier_id, bool eligible);

 private:
  mutable std::mutex              mutex_;
  std::unordered_set<std::string> blocked_;
};

} // namespace routebid::identity
