#include "write_serializer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace lieko::lock {

WriteSerializer::Guard::Guard(WriteSerializer* owner, std::shared_ptr<std::timed_mutex> mutex, std::string key)
    : owner_(owner), mutex_(std::move(mutex)), key_(std::move(key)) {
}

WriteSerializer::Guard::~Guard() {
  if (mutex_) owner_->Release(key_, mutex_, true);
}

WriteSerializer::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), mutex_(std::move(other.mutex_)), key_(std::move(other.key_)) {
}

WriteSerializer::WriteSerializer(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

std::shared_ptr<std::timed_mutex> WriteSerializer::KeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::timed_mutex>();
  }
  return key_mutex;
}

void WriteSerializer::Release(const std::string& key, std::shared_ptr<std::timed_mutex>& mutex, bool locked) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  if (locked) mutex->unlock();

  // Every holder and waiter copies the pointer under this mutex, so the
  // map's reference plus ours means nobody else can reach the key.
  auto it = key_mutexes_.find(key);
  if (it != key_mutexes_.end() && it->second == mutex && mutex.use_count() == 2) {
    key_mutexes_.erase(it);
  }
  mutex.reset();
}

WriteSerializer::Guard WriteSerializer::Acquire(const std::string& key) {
  return Acquire(key, timeout_);
}

WriteSerializer::Guard WriteSerializer::Acquire(const std::string& key, std::chrono::milliseconds timeout) {
  auto       key_mutex  = KeyMutex(key);
  const auto started_at = std::chrono::steady_clock::now();

  if (timeout <= std::chrono::milliseconds::zero()) {
    key_mutex->lock();
  } else if (!key_mutex->try_lock_for(timeout)) {
    Release(key, key_mutex, false);
    LIEKO_LOG_WARN("Write lock timed out",
                   {observability::StringField("resource", key), observability::IntField("timeout_ms", timeout.count())});
    throw util::ResourceExhausted("timed out after " + std::to_string(timeout.count()) + "ms waiting for write lock on '" + key + "'");
  }

  observability::Metrics::Instance().ObserveLockWaitMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return Guard(this, std::move(key_mutex), key);
}

bool WriteSerializer::IsHeld(const std::string& key) const {
  std::shared_ptr<std::timed_mutex> key_mutex;
  {
    std::lock_guard<std::mutex> lock(key_mutexes_guard_);
    auto                        it = key_mutexes_.find(key);
    if (it == key_mutexes_.end()) return false;
    key_mutex = it->second;
  }
  if (!key_mutex->try_lock()) return true;
  key_mutex->unlock();
  return false;
}

size_t WriteSerializer::TrackedKeys() const {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  return key_mutexes_.size();
}

} // namespace lieko::lock
