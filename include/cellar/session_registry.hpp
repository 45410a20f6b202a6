#pragma once

// cellar/session_registry.hpp — Process-wide directory of active sessions.
//
// STRUCTURE:
//   N shards, each {mutex, id -> shared_ptr<Entry>}. A shard lock is held only
//   for map lookups/inserts/erases, never across I/O. Each Entry has its own
//   mutex; touch() and the sweep decision for one id serialize on it, so
//   touch() calls for different ids never contend beyond a shard lookup.
//
// STATE MACHINE per id:
//   Unseen --touch--> Active --touch--> Active
//   Active --sweep (idle > ttl)--> Expired   (terminal; record + workspace gone)
//   A later touch() with the same id creates a fresh Active entry.
//
// SWEEP vs TOUCH:
//   sweep() snapshots candidates, then for each takes the entry lock and
//   re-checks idleness against the sweep's own timestamp. A touch that lands
//   before that re-check keeps the session alive; a touch that arrives while
//   the purge is running waits, sees `expired`, and installs a new entry.
//   An entry is erased only if the map still points at that same entry.
//
// LOCK ORDER: entry mutex, then shard mutex. touch() never holds a shard
// mutex while waiting on an entry mutex.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cellar/types.hpp"

namespace cellar {

class WorkspaceStore;

class SessionRegistry {
 public:
  using Clock = std::function<uint64_t()>;  // unix ms

  explicit SessionRegistry(WorkspaceStore& store, Clock clock = {}, std::size_t shard_count = 16);

  SessionRecord touch(const SessionId& id);
  std::optional<SessionRecord> find(const SessionId& id) const;

  // Inserts a record for a workspace found on disk. No-op if present.
  bool adopt(const SessionId& id, uint64_t created_at_unix_ms, uint64_t last_seen_unix_ms);

  // Returns the number of sessions purged.
  std::size_t sweep(std::chrono::milliseconds ttl);

  // Explicit user-initiated purge. Idempotent.
  Status purge(const SessionId& id);

  RegistryStats stats() const;
  std::size_t size() const;
  std::vector<SessionRecord> snapshot() const;

 private:
  struct Entry {
    std::mutex mu;
    bool expired{false};  // guarded by mu
    uint64_t created_at{0};
    std::atomic<uint64_t> last_seen{0};
  };
  struct Shard {
    mutable std::mutex mu;
    std::unordered_map<SessionId, std::shared_ptr<Entry>> map;
  };

  Shard& shard_for(const SessionId& id) const;
  // Returns the live entry for id, replacing an expired one. created is set
  // when a new entry was inserted.
  std::shared_ptr<Entry> acquire(const SessionId& id, uint64_t now, bool& created);
  void erase_if_same(const SessionId& id, const std::shared_ptr<Entry>& e);
  SessionRecord record_for(const SessionId& id, const Entry& e) const;

  WorkspaceStore& store_;
  Clock clock_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace cellar
