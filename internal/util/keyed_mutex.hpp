#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace outflow::util {

/*
  One mutex per string key, created on first use.

  An entry lives only while some caller holds or waits on it, so the table is
  bounded by in-flight work rather than by every id ever locked.
*/
class KeyedMutex {
 public:
  class Lock {
   public:
    Lock(Lock&& other) noexcept;
    Lock& operator=(Lock&&) = delete;
    Lock(const Lock&)       = delete;
    ~Lock();

   private:
    friend class KeyedMutex;
    Lock(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex);

    KeyedMutex*                  owner_;
    std::string                  key_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  Lock Acquire(const std::string& key);
  // Sorted and deduplicated, so two callers locking overlapping sets cannot deadlock.
  std::vector<Lock> AcquireAll(std::vector<std::string> keys);

  std::size_t Size() const;

 private:
  void Release(const std::string& key, std::shared_ptr<std::mutex> mutex);

  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace outflow::util
