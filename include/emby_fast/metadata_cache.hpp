#pragma once

#include "emby_fast/metadata_client.hpp"
#include "emby_fast/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace emby_fast {

struct MetadataCacheConfig {
  std::size_t capacity{4096};
  std::chrono::milliseconds ttl{std::chrono::minutes(5)};
};

struct MetadataCacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t evictions{0};
  std::uint64_t upstream_fetches{0};
  std::uint64_t coalesced_waits{0};
  std::uint64_t fetch_failures{0};
};

// Bounded item-id -> ItemInfo cache. Entries older than the TTL are never
// returned; the least recently used entry is evicted at capacity. Concurrent
// misses for one id share a single upstream fetch.
class MetadataCache {
public:
  MetadataCache(MetadataCacheConfig cfg, const IClock &clock);

  std::optional<ItemInfo> get_or_fetch(const std::string &item_id,
                                       IMetadataSource &source,
                                       std::string *err = nullptr);
  std::optional<ItemInfo> get(const std::string &item_id);
  void put(const std::string &item_id, ItemInfo info);
  bool erase(const std::string &item_id);
  void clear();

  std::size_t size() const;
  std::size_t capacity() const { return cfg_.capacity; }
  MetadataCacheStats stats() const;
  std::string info() const;

private:
  struct Slot {
    ItemInfo info;
    TimePoint fetched_at;
    std::list<std::string>::iterator lru_pos;
  };

  struct Flight {
    bool done{false};
    std::optional<ItemInfo> result;
    std::string err;
    std::condition_variable cv;
  };

  // Callers hold mu_.
  std::optional<ItemInfo> lookup_locked(const std::string &item_id);
  void insert_locked(const std::string &item_id, ItemInfo info);
  void erase_locked(std::unordered_map<std::string, Slot>::iterator it);

  MetadataCacheConfig cfg_;
  const IClock &clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> entries_;
  std::list<std::string> lru_;
  std::unordered_map<std::string, std::shared_ptr<Flight>> in_flight_;
  MetadataCacheStats stats_;
};

} // namespace emby_fast
