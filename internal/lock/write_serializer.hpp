#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lieko::lock {

/*
  Per-resource exclusive write lock.

  At most one writer holds a given key at a time. Readers never take
  this lock. Acquire() returns a guard that releases on destruction, so
  every exit path of a write, including exceptions, releases the key.

  A non-zero timeout bounds the wait; expiry throws
  util::ResourceExhausted (LOCK_TIMEOUT) before any mutation happens.

  A key is tracked only while some caller holds or waits on it; the
  last one out erases it, so arbitrary names never accumulate.
*/
class WriteSerializer {
 public:
  class Guard {
   public:
    Guard(WriteSerializer* owner, std::shared_ptr<std::timed_mutex> mutex, std::string key);
    ~Guard();

    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    const std::string& Key() const {
      return key_;
    }

   private:
    WriteSerializer*                  owner_;
    std::shared_ptr<std::timed_mutex> mutex_;
    std::string                       key_;
  };

  explicit WriteSerializer(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

  Guard Acquire(const std::string& key);
  Guard Acquire(const std::string& key, std::chrono::milliseconds timeout);

  // Diagnostic only; the answer may be stale on return.
  bool IsHeld(const std::string& key) const;

  // Keys currently held or waited on.
  size_t TrackedKeys() const;

 private:
  std::shared_ptr<std::timed_mutex> KeyMutex(const std::string& key);

  // Drops one reference to the key's mutex, unlocking it first when held.
  void Release(const std::string& key, std::shared_ptr<std::timed_mutex>& mutex, bool locked);

  std::chrono::milliseconds timeout_;

  mutable std::mutex                                                         key_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> key_mutexes_;
};

} // namespace lieko::lock
