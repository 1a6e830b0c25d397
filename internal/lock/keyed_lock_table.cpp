#include "internal/lock/keyed_lock_table.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace routebid::lock {

KeyedLockTable::Guard::Guard(KeyedLockTable* table, std::shared_ptr<std::timed_mutex> mutex, std::string key)
    : table_(table), mutex_(std::move(mutex)), key_(std::move(key)) {
}

KeyedLockTable::Guard::~Guard() {
  Release();
}

KeyedLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), mutex_(std::move(other.mutex_)), key_(std::move(other.key_)) {
}

KeyedLockTable::Guard& KeyedLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_ = other.table_;
    mutex_ = std::move(other.mutex_);
    key_   = std::move(other.key_);
  }
  return *this;
}

void KeyedLockTable::Guard::Release() {
  if (mutex_) {
    mutex_->unlock();
    if (table_) {
      table_->Forget(key_, mutex_);
    }
    mutex_.reset();
  }
}

KeyedLockTable::KeyedLockTable(LockOptions options) : options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

std::shared_ptr<std::timed_mutex> KeyedLockTable::MutexFor(const std::string& key) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       mutex = locks_[key];
  if (!mutex) {
    mutex = std::make_shared<std::timed_mutex>();
  }
  return mutex;
}

// The map holds one reference and the caller another; any more means a
// guard or a waiter still uses the mutex.
void KeyedLockTable::Forget(const std::string& key, const std::shared_ptr<std::timed_mutex>& mutex) {
  std::lock_guard<std::mutex> lock(guard_);
  auto                        it = locks_.find(key);
  if (it != locks_.end() && it->second == mutex && mutex.use_count() <= 2) {
    locks_.erase(it);
  }
}

std::size_t KeyedLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return locks_.size();
}

KeyedLockTable::Guard KeyedLockTable::Acquire(const std::string& key) {
  auto mutex = MutexFor(key);

  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    if (mutex->try_lock_for(options_.acquire_timeout)) {
      return Guard(this, std::move(mutex), key);
    }
    if (attempt < options_.max_attempts) {
      std::this_thread::sleep_for(options_.retry_backoff * attempt);
    }
  }

  Forget(key, mutex);
  ROUTEBID_LOG_WARN("lock acquisition exhausted retries",
                    {observability::StringField("key", key), observability::IntField("attempts", options_.max_attempts)});
  observability::Metrics::Instance().RecordLockBusy(key.substr(0, key.find(':')));
  throw util::Busy("lock busy: " + key);
}

std::string KeyedLockTable::PackageKey(std::string_view package_id) {
  return "package:" + std::string(package_id);
}

std::string KeyedLockTable::CourierKey(std::string_view courier_id) {
  return "courier:" + std::string(courier_id);
}

} // namespace routebid::lock
