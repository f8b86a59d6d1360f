#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>

#include <absl/hash/hash.h>

namespace reconciler::util {

/*
  Striped mutex keyed by hash.

  Serializes work on the same key across threads while unrelated keys
  only contend when they share a stripe.
*/
template <typename Key, std::size_t NumStripes = 64>
class StripedLock {
 public:
  std::size_t GetStripeIndex(const Key& key) const {
    return absl::Hash<Key>{}(key) % NumStripes;
  }

  std::mutex& MutexFor(const Key& key) {
    return locks_[GetStripeIndex(key)].mutex;
  }

  // RAII guard for exclusive access to one key.
  class ExclusiveLock {
   public:
    ExclusiveLock(StripedLock& striped, const Key& key) : lock_(striped.MutexFor(key)) {
    }

    ExclusiveLock(const ExclusiveLock&)            = delete;
    ExclusiveLock& operator=(const ExclusiveLock&) = delete;

   private:
    std::lock_guard<std::mutex> lock_;
  };

 private:
  struct alignas(64) CacheAlignedMutex {
    std::mutex mutex;
  };
  std::array<CacheAlignedMutex, NumStripes> locks_;
};

using NameLock = StripedLock<std::string>;

} // namespace reconciler::util
