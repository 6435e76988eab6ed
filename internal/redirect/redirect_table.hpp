#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "redirect_entry.hpp"
#include "internal/util/time.hpp"

namespace hosting::redirect {

/*
  Sharded, expiring prefix map consulted on every proxied request.

  Entries live in the shard chosen by their scope (the key without its last
  path segment), so a lookup for a path only locks the shards of its own
  '/'-terminated prefixes and never walks the whole table. Expiry checks,
  renewals and sweeps of an entry all happen under its shard lock.
*/
class RedirectTable {
 public:
  static constexpr std::chrono::seconds kDefaultTtl{120};

  struct Options {
    std::chrono::milliseconds ttl{kDefaultTtl};
    std::size_t               shards = 16;
    util::ClockFn             clock;
  };

  RedirectTable();
  explicit RedirectTable(Options options);

  RedirectTable(const RedirectTable&)            = delete;
  RedirectTable& operator=(const RedirectTable&) = delete;

  // Longest live key prefixing `path`; renews the hit. Misses return
  // (default_upstream, path) untouched.
  Resolution Resolve(const std::string& path, const std::string& default_upstream);

  // Reuses a live entry minted under `session_prefix` for the same upstream,
  // otherwise mints a new key.
  std::string Allocate(const std::string& session_prefix, const std::string& upstream_prefix);

  // Removes every entry whose key starts with `prefix`.
  std::size_t Flush(const std::string& prefix);

  std::size_t SweepExpired();

  // Live entries only.
  std::size_t Size() const;

  std::chrono::milliseconds Ttl() const {
    return ttl_;
  }

 private:
  struct Shard {
    mutable std::mutex                                mutex;
    std::unordered_map<std::string, RedirectEntry>    entries;
    std::unordered_multimap<std::string, std::string> by_scope;
    util::TimePoint                                   next_sweep{};
  };

  Shard&             ShardFor(std::string_view scope) const;
  util::TimePoint    Now() const;
  static std::string ScopeOf(const std::string& key);
  static bool        IsExpired(const RedirectEntry& entry, util::TimePoint now);

  static void  EraseLocked(Shard& shard, std::unordered_map<std::string, RedirectEntry>::iterator it);
  std::size_t  SweepLocked(Shard& shard, util::TimePoint now) const;
  void         MaybeSweepLocked(Shard& shard, util::TimePoint now) const;

  std::chrono::milliseconds           ttl_;
  util::ClockFn                       clock_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace hosting::redirect
