#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace routebid::lock {

struct LockOptions {
  std::chrono::milliseconds acquire_timeout{2000};
  std::uint32_t             max_attempts{3};
  // Attempt n sleeps n * retry_backoff before retrying.
  std::chrono::milliseconds retry_backoff{50};
};

/*
  Exclusive per-key locks (one per package, one per courier).

  Acquire() waits at most acquire_timeout per attempt and retries up to
  max_attempts times before failing with util::Busy. Mutexes are created
  lazily and dropped once no guard or waiter refers to them, so the table
  only holds keys that are in use.
*/
class KeyedLockTable {
 public:
  class Guard {
   public:
    Guard() = default;
    Guard(KeyedLockTable* table, std::shared_ptr<std::timed_mutex> mutex, std::string key);
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;

    const std::string& Key() const {
      return key_;
    }

    void Release();

   private:
    KeyedLockTable*                   table_ = nullptr;
    std::shared_ptr<std::timed_mutex> mutex_;
    std::string                       key_;
  };

  explicit KeyedLockTable(LockOptions options = {});

  [[nodiscard]] Guard Acquire(const std::string& key);

  static std::string PackageKey(std::string_view package_id);
  static std::string CourierKey(std::string_view courier_id);

  const LockOptions& Options() const {
    return options_;
  }

  // Keys currently held or waited on.
  std::size_t Size() const;

 private:
  std::shared_ptr<std::timed_mutex> MutexFor(const std::string& key);
  void                              Forget(const std::string& key, const std::shared_ptr<std::timed_mutex>& mutex);

  LockOptions options_;

  mutable std::mutex                                                 guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> locks_;
};

} // namespace routebid::lock
