#include "version_cache.hpp"

namespace reconciler::cache {

// ------------------------------------------------------------
// Contains
// ------------------------------------------------------------

bool VersionCache::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return cache_.contains(name);
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<AppliedRecord> VersionCache::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(name);
  if (it == cache_.end())
    return std::nullopt;

  return it->second;
}

std::optional<AppliedRecord> VersionCache::Get(const std::string& name, std::int64_t version) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(name);
  if (it == cache_.end() || it->second.version != version)
    return std::nullopt;

  return it->second;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void VersionCache::Put(const std::string& name, AppliedRecord record) {
  std::unique_lock lock(mutex_);
  cache_[name] = std::move(record);
}

std::size_t VersionCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace reconciler::cache
