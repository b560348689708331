#include "internal/util/keyed_mutex.hpp"

#include <algorithm>

namespace outflow::util {

KeyedMutex::Lock::Lock(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex)
    : owner_(owner), key_(std::move(key)), mutex_(std::move(mutex)), lock_(*mutex_) {
}

KeyedMutex::Lock::Lock(Lock&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), mutex_(std::move(other.mutex_)), lock_(std::move(other.lock_)) {
  other.owner_ = nullptr;
}

KeyedMutex::Lock::~Lock() {
  if (owner_ == nullptr) {
    return;
  }
  lock_.unlock();
  owner_->Release(key_, std::move(mutex_));
}

KeyedMutex::Lock KeyedMutex::Acquire(const std::string& key) {
  std::shared_ptr<std::mutex> mutex;
  {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       entry = mutexes_[key];
    if (!entry) {
      entry = std::make_shared<std::mutex>();
    }
    mutex = entry;
  }
  return Lock(this, key, std::move(mutex));
}

std::vector<KeyedMutex::Lock> KeyedMutex::AcquireAll(std::vector<std::string> keys) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  std::vector<Lock> locks;
  locks.reserve(keys.size());
  for (const auto& key : keys) {
    locks.push_back(Acquire(key));
  }
  return locks;
}

std::size_t KeyedMutex::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

void KeyedMutex::Release(const std::string& key, std::shared_ptr<std::mutex> mutex) {
  std::lock_guard<std::mutex> lock(guard_);
  mutex.reset();
  // Copies are only taken under guard_, so a lone map reference means no holder or waiter.
  auto it = mutexes_.find(key);
  if (it != mutexes_.end() && it->second.use_count() == 1) {
    mutexes_.erase(it);
  }
}

} // namespace outflow::util
