#include "internal/identity/courier_eligibility.hpp"

namespace routebid::identity {

bool EligibilityRegistry::IsEligible(const std::string& courier_id) const {
  std::lock_guard lock(mutex_);
  return !blocked_.contains(courier_id);
}

void EligibilityRegistry::SetEligible(const std::string& courier_id, bool eligible) {
  std::lock_guard lock(mutex_);
  if (eligible) {
    blocked_.erase(courier_id);
  } else {
    blocked_.insert(courier_id);
  }
}

} // namespace routebid::identity
