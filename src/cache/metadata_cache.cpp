#include "emby_fast/metadata_cache.hpp"

#include <sstream>

namespace emby_fast {

MetadataCache::MetadataCache(MetadataCacheConfig cfg, const IClock &clock)
    : cfg_(cfg), clock_(clock) {
  if (cfg_.capacity == 0)
    cfg_.capacity = 1;
}

std::optional<ItemInfo>
MetadataCache::lookup_locked(const std::string &item_id) {
  auto it = entries_.find(item_id);
  if (it == entries_.end())
    return std::nullopt;
  if (clock_.now() - it->second.fetched_at >= cfg_.ttl) {
    ++stats_.expirations;
    erase_locked(it);
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  return it->second.info;
}

void MetadataCache::insert_locked(const std::string &item_id, ItemInfo info) {
  auto it = entries_.find(item_id);
  if (it != entries_.end()) {
    it->second.info = std::move(info);
    it->second.fetched_at = clock_.now();
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return;
  }
  while (entries_.size() >= cfg_.capacity && !lru_.empty()) {
    ++stats_.evictions;
    erase_locked(entries_.find(lru_.back()));
  }
  lru_.push_front(item_id);
  entries_.emplace(item_id, Slot{std::move(info), clock_.now(), lru_.begin()});
}

void MetadataCache::erase_locked(
    std::unordered_map<std::string, Slot>::iterator it) {
  lru_.erase(it->second.lru_pos);
  entries_.erase(it);
}

std::optional<ItemInfo> MetadataCache::get_or_fetch(const std::string &item_id,
                                                    IMetadataSource &source,
                                                    std::string *err) {
  std::unique_lock<std::mutex> lk(mu_);
  if (auto hit = lookup_locked(item_id)) {
    ++stats_.hits;
    return hit;
  }
  ++stats_.misses;

  auto existing = in_flight_.find(item_id);
  if (existing != in_flight_.end()) {
    auto flight = existing->second;
    ++stats_.coalesced_waits;
    flight->cv.wait(lk, [&] { return flight->done; });
    if (!flight->result && err)
      *err = flight->err;
    return flight->result;
  }

  auto flight = std::make_shared<Flight>();
  in_flight_.emplace(item_id, flight);
  ++stats_.upstream_fetches;
  lk.unlock();

  std::optional<ItemInfo> result;
  std::string fetch_err;
  try {
    result = source.lookup(item_id, &fetch_err);
  } catch (const std::exception &e) {
    fetch_err = std::string("lookup threw: ") + e.what();
  } catch (...) {
    fetch_err = "lookup threw an unknown exception";
  }
  if (!result && fetch_err.empty())
    fetch_err = "lookup failed";

  lk.lock();
  if (result)
    insert_locked(item_id, *result);
  else
    ++stats_.fetch_failures;
  flight->result = result;
  flight->err = fetch_err;
  flight->done = true;
  in_flight_.erase(item_id);
  lk.unlock();
  flight->cv.notify_all();

  if (!result && err)
    *err = fetch_err;
  return result;
}

std::optional<ItemInfo> MetadataCache::get(const std::string &item_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto hit = lookup_locked(item_id);
  if (hit)
    ++stats_.hits;
  else
    ++stats_.misses;
  return hit;
}

void MetadataCache::put(const std::string &item_id, ItemInfo info) {
  std::lock_guard<std::mutex> lk(mu_);
  insert_locked(item_id, std::move(info));
}

bool MetadataCache::erase(const std::string &item_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(item_id);
  if (it == entries_.end())
    return false;
  erase_locked(it);
  return true;
}

void MetadataCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
  lru_.clear();
}

std::size_t MetadataCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

MetadataCacheStats MetadataCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

std::string MetadataCache::info() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::ostringstream os;
  os << "cache_entries:" << entries_.size() << "\n";
  os << "cache_capacity:" << cfg_.capacity << "\n";
  os << "cache_ttl_ms:" << cfg_.ttl.count() << "\n";
  os << "cache_hits:" << stats_.hits << "\n";
  os << "cache_misses:" << stats_.misses << "\n";
  os << "cache_expirations:" << stats_.expirations << "\n";
  os << "cache_evictions:" << stats_.evictions << "\n";
  os << "upstream_fetches:" << stats_.upstream_fetches << "\n";
  os << "coalesced_waits:" << stats_.coalesced_waits << "\n";
  os << "fetch_failures:" << stats_.fetch_failures << "\n";
  return os.str();
}

} // namespace emby_fast
