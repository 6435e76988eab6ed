#include "redirect_table.hpp"

#include <functional>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace hosting::redirect {

namespace {

constexpr std::string_view kKeyMarker = "redir-";

bool IsPathPrefix(const std::string& value) {
  return !value.empty() && value.front() == '/' && value.back() == '/';
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

RedirectTable::RedirectTable() : RedirectTable(Options{}) {
}

RedirectTable::RedirectTable(Options options) : ttl_(options.ttl), clock_(std::move(options.clock)) {
  if (ttl_.count() <= 0) {
    throw std::invalid_argument("redirect ttl must be positive");
  }
  const auto shard_count = options.shards == 0 ? 1 : options.shards;
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

util::TimePoint RedirectTable::Now() const {
  return clock_ ? clock_() : util::Now();
}

RedirectTable::Shard& RedirectTable::ShardFor(std::string_view scope) const {
  return *shards_[std::hash<std::string_view>{}(scope) % shards_.size()];
}

// "/m4d/S1/redir-x/" -> "/m4d/S1/"
std::string RedirectTable::ScopeOf(const std::string& key) {
  if (key.size() < 2) {
    return {};
  }
  const auto slash = key.rfind('/', key.size() - 2);
  if (slash == std::string::npos) {
    return {};
  }
  return key.substr(0, slash + 1);
}

bool RedirectTable::IsExpired(const RedirectEntry& entry, util::TimePoint now) {
  return entry.expires_at <= now;
}

void RedirectTable::EraseLocked(Shard& shard, std::unordered_map<std::string, RedirectEntry>::iterator it) {
  auto range = shard.by_scope.equal_range(it->second.scope);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == it->first) {
      shard.by_scope.erase(i);
      break;
    }
  }
  shard.entries.erase(it);
}

std::size_t RedirectTable::SweepLocked(Shard& shard, util::TimePoint now) const {
  std::size_t removed = 0;
  for (auto it = shard.entries.begin(); it != shard.entries.end();) {
    if (!IsExpired(it->second, now)) {
      ++it;
      continue;
    }
    auto victim = it++;
    EraseLocked(shard, victim);
    ++removed;
  }
  shard.next_sweep = now + ttl_ / 4;
  return removed;
}

void RedirectTable::MaybeSweepLocked(Shard& shard, util::TimePoint now) const {
  if (now >= shard.next_sweep) {
    SweepLocked(shard, now);
  }
}

Resolution RedirectTable::Resolve(const std::string& path, const std::string& default_upstream) {
  Resolution miss{default_upstream, path, false};
  if (path.empty() || path.front() != '/') {
    return miss;
  }

  const auto now = Now();

  // candidate keys are the '/'-terminated prefixes of path, longest first
  for (auto end = path.rfind('/'); end != std::string::npos && end > 0; end = path.rfind('/', end - 1)) {
    const auto candidate = path.substr(0, end + 1);
    auto&      shard     = ShardFor(ScopeOf(candidate));

    std::lock_guard lock(shard.mutex);
    MaybeSweepLocked(shard, now);

    auto it = shard.entries.find(candidate);
    if (it == shard.entries.end()) {
      continue;
    }
    if (IsExpired(it->second, now)) {
      EraseLocked(shard, it);
      continue;
    }

    it->second.expires_at = now + ttl_;
    // the remainder keeps the key's trailing '/' as its leading separator
    return Resolution{it->second.upstream, path.substr(candidate.size() - 1), true};
  }

  return miss;
}

std::string RedirectTable::Allocate(const std::string& session_prefix, const std::string& upstream_prefix) {
  if (!IsPathPrefix(session_prefix)) {
    throw util::ValidationError("redirect session prefix must start and end with '/': " + session_prefix);
  }
  if (upstream_prefix.empty() || upstream_prefix.back() != '/') {
    throw util::ValidationError("redirect upstream prefix must end with '/': " + upstream_prefix);
  }

  const auto now   = Now();
  auto&      shard = ShardFor(session_prefix);

  std::lock_guard lock(shard.mutex);
  MaybeSweepLocked(shard, now);

  auto range = shard.by_scope.equal_range(session_prefix);
  for (auto it = range.first; it != range.second; ++it) {
    auto entry_it = shard.entries.find(it->second);
    if (entry_it == shard.entries.end() || IsExpired(entry_it->second, now)) {
      continue;
    }
    if (entry_it->second.upstream == upstream_prefix) {
      entry_it->second.expires_at = now + ttl_;
      return entry_it->first;
    }
  }

  RedirectEntry entry;
  entry.key        = session_prefix + std::string(kKeyMarker) + util::GenerateUUIDString() + "/";
  entry.upstream   = upstream_prefix;
  entry.scope      = session_prefix;
  entry.expires_at = now + ttl_;

  shard.by_scope.emplace(entry.scope, entry.key);
  auto key = entry.key;
  shard.entries.emplace(key, std::move(entry));
  return key;
}

std::size_t RedirectTable::Flush(const std::string& prefix) {
  std::size_t removed = 0;
  for (auto& shard : shards_) {
    std::lock_guard lock(shard->mutex);
    for (auto it = shard->entries.begin(); it != shard->entries.end();) {
      if (!StartsWith(it->first, prefix)) {
        ++it;
        continue;
      }
      auto victim = it++;
      EraseLocked(*shard, victim);
      ++removed;
    }
  }
  return removed;
}

std::size_t RedirectTable::SweepExpired() {
  const auto  now     = Now();
  std::size_t removed = 0;
  for (auto& shard : shards_) {
    std::lock_guard lock(shard->mutex);
    removed += SweepLocked(*shard, now);
  }
  return removed;
}

std::size_t RedirectTable::Size() const {
  const auto  now  = Now();
  std::size_t live = 0;
  for (const auto& shard : shards_) {
    std::lock_guard lock(shard->mutex);
    for (const auto& [key, entry] : shard->entries) {
      if (!IsExpired(entry, now)) {
        ++live;
      }
    }
  }
  return live;
}

} // namespace hosting::redirect
