#include "cellar/session_registry.hpp"

#include "cellar/log.hpp"
#include "cellar/observability.hpp"
#include "cellar/workspace_store.hpp"

namespace cellar {

namespace {
constexpr const char* kComponent = "registry";
}  // namespace

SessionRegistry::SessionRegistry(WorkspaceStore& store, Clock clock, std::size_t shard_count)
    : store_(store), clock_(clock ? std::move(clock) : Clock(now_unix_ms)) {
  if (shard_count == 0) shard_count = 1;
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) shards_.push_back(std::make_unique<Shard>());
}

SessionRegistry::Shard& SessionRegistry::shard_for(const SessionId& id) const {
  return *shards_[std::hash<SessionId>{}(id) % shards_.size()];
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::acquire(const SessionId& id, uint64_t now,
                                                                 bool& created) {
  Shard& sh = shard_for(id);
  std::lock_guard<std::mutex> lk(sh.mu);
  auto& slot = sh.map[id];
  if (slot) {
    // `expired` is only ever set under the entry lock; a stale read here just
    // costs one retry in touch().
    std::unique_lock<std::mutex> el(slot->mu, std::try_to_lock);
    const bool expired = el.owns_lock() && slot->expired;
    if (!expired) {
      created = false;
      return slot;
    }
  }
  auto e = std::make_shared<Entry>();
  e->created_at = now;
  e->last_seen.store(now, std::memory_order_relaxed);
  slot = e;
  created = true;
  return e;
}

void SessionRegistry::erase_if_same(const SessionId& id, const std::shared_ptr<Entry>& e) {
  Shard& sh = shard_for(id);
  std::lock_guard<std::mutex> lk(sh.mu);
  auto it = sh.map.find(id);
  if (it != sh.map.end() && it->second == e) sh.map.erase(it);
}

SessionRecord SessionRegistry::record_for(const SessionId& id, const Entry& e) const {
  SessionRecord r;
  r.id = id;
  r.created_at_unix_ms = e.created_at;
  r.last_seen_unix_ms = e.last_seen.load(std::memory_order_acquire);
  r.workspace_root = store_.layout(id).root;
  return r;
}

SessionRecord SessionRegistry::touch(const SessionId& id) {
  auto& stats = global_service_stats();
  for (;;) {
    const uint64_t now = clock_();
    bool created = false;
    auto e = acquire(id, now, created);
    std::lock_guard<std::mutex> el(e->mu);
    if (e->expired) continue;  // lost to a concurrent sweep; install a fresh entry
    uint64_t prev = e->last_seen.load(std::memory_order_relaxed);
    while (prev < now && !e->last_seen.compare_exchange_weak(prev, now, std::memory_order_acq_rel)) {
    }
    stats.sessions_touched.fetch_add(1, std::memory_order_relaxed);
    if (created) {
      stats.sessions_created.fetch_add(1, std::memory_order_relaxed);
      log_event(LogLevel::debug, kComponent, "session active", {{"session_id", id}});
    }
    return record_for(id, *e);
  }
}

std::optional<SessionRecord> SessionRegistry::find(const SessionId& id) const {
  Shard& sh = shard_for(id);
  std::shared_ptr<Entry> e;
  {
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.map.find(id);
    if (it == sh.map.end()) return std::nullopt;
    e = it->second;
  }
  std::lock_guard<std::mutex> el(e->mu);
  if (e->expired) return std::nullopt;
  return record_for(id, *e);
}

bool SessionRegistry::adopt(const SessionId& id, uint64_t created_at_unix_ms, uint64_t last_seen_unix_ms) {
  if (!is_valid_session_id(id)) return false;
  Shard& sh = shard_for(id);
  std::lock_guard<std::mutex> lk(sh.mu);
  if (sh.map.contains(id)) return false;
  auto e = std::make_shared<Entry>();
  e->created_at = created_at_unix_ms;
  e->last_seen.store(last_seen_unix_ms, std::memory_order_relaxed);
  sh.map.emplace(id, std::move(e));
  return true;
}

std::size_t SessionRegistry::sweep(std::chrono::milliseconds ttl) {
  auto& stats = global_service_stats();
  const uint64_t now = clock_();
  const uint64_t ttl_ms = static_cast<uint64_t>(ttl.count() < 0 ? 0 : ttl.count());
  auto idle_past_ttl = [&](uint64_t last_seen) { return now > last_seen && now - last_seen > ttl_ms; };

  std::vector<std::pair<SessionId, std::shared_ptr<Entry>>> candidates;
  for (const auto& sh : shards_) {
    std::lock_guard<std::mutex> lk(sh->mu);
    for (const auto& [id, e] : sh->map) {
      if (idle_past_ttl(e->last_seen.load(std::memory_order_acquire))) candidates.emplace_back(id, e);
    }
  }

  std::size_t purged = 0;
  std::size_t failures = 0;
  for (const auto& [id, e] : candidates) {
    std::lock_guard<std::mutex> el(e->mu);
    if (e->expired) continue;
    // Re-check: a touch after the snapshot keeps the session.
    if (!idle_past_ttl(e->last_seen.load(std::memory_order_acquire))) continue;
    e->expired = true;
    const Status st = store_.purge(id);
    if (!st.ok()) {
      e->expired = false;  // retried next cycle
      ++failures;
      log_event(LogLevel::error, kComponent, "expiry purge failed",
                {{"session_id", id}, {"error", to_string(st.code)}, {"detail", st.message}});
      continue;
    }
    erase_if_same(id, e);
    ++purged;
    stats.sessions_expired.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::info, kComponent, "session expired", {{"session_id", id}});
  }

  stats.sweeps_run.fetch_add(1, std::memory_order_relaxed);
  if (failures) stats.sweep_failures.fetch_add(failures, std::memory_order_relaxed);
  log_event(LogLevel::info, kComponent, "sweep finished",
            {{"candidates", std::to_string(candidates.size())},
             {"purged", std::to_string(purged)},
             {"failures", std::to_string(failures)}});
  return purged;
}

Status SessionRegistry::purge(const SessionId& id) {
  if (!is_valid_session_id(id)) {
    return Status::failure(ErrorCode::invalid_session_id, "malformed session id");
  }
  for (;;) {
    bool created = false;
    auto e = acquire(id, clock_(), created);
    std::lock_guard<std::mutex> el(e->mu);
    if (e->expired) continue;
    e->expired = true;
    const Status st = store_.purge(id);
    if (!st.ok()) {
      e->expired = false;
      if (created) erase_if_same(id, e);
      return st;
    }
    erase_if_same(id, e);
    return Status::success();
  }
}

RegistryStats SessionRegistry::stats() const {
  RegistryStats s;
  s.active_sessions = size();
  s.total_bytes = store_.total_usage().bytes_used;
  return s;
}

std::size_t SessionRegistry::size() const {
  std::size_t n = 0;
  for (const auto& sh : shards_) {
    std::lock_guard<std::mutex> lk(sh->mu);
    n += sh->map.size();
  }
  return n;
}

std::vector<SessionRecord> SessionRegistry::snapshot() const {
  std::vector<std::pair<SessionId, std::shared_ptr<Entry>>> entries;
  for (const auto& sh : shards_) {
    std::lock_guard<std::mutex> lk(sh->mu);
    for (const auto& [id, e] : sh->map) entries.emplace_back(id, e);
  }
  std::vector<SessionRecord> out;
  out.reserve(entries.size());
  for (const auto& [id, e] : entries) out.push_back(record_for(id, *e));
  return out;
}

}  // namespace cellar
