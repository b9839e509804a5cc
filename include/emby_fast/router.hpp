#pragma once

#include "emby_fast/http.hpp"
#include "emby_fast/metadata_cache.hpp"
#include "emby_fast/metadata_client.hpp"
#include "emby_fast/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace emby_fast {

struct PlaybackInfoMatch {
  std::string item_id;
  std::string media_source_id;
};

// Matches GET/POST ".../Items/{id}/PlaybackInfo" (literal segments compared
// case-insensitively, query ignored for the match).
std::optional<PlaybackInfoMatch> match_playback_info(const std::string &method,
                                                     const std::string &target);

struct RouteResult {
  RouteDecision decision{RouteDecision::Passthrough};
  bool matched{false};
  bool classification_failed{false};
  std::string item_id;
  std::string media_source_id;
  std::optional<std::string> stream_url;
};

struct RouterStats {
  std::uint64_t classified{0};
  std::uint64_t matched{0};
  std::uint64_t bypassed{0};
  std::uint64_t passthrough{0};
  std::uint64_t classification_failures{0};
};

class Router {
public:
  Router(MetadataCache &cache, IMetadataSource &source,
         bool bypass_enabled = true);

  // Never fails: a metadata lookup error degrades to Passthrough.
  RouteResult classify(const HttpRequestHead &req);

  RouterStats stats() const;
  std::string info() const;

private:
  MetadataCache &cache_;
  IMetadataSource &source_;
  bool bypass_enabled_;
  std::atomic<std::uint64_t> classified_{0};
  std::atomic<std::uint64_t> matched_{0};
  std::atomic<std::uint64_t> bypassed_{0};
  std::atomic<std::uint64_t> passthrough_{0};
  std::atomic<std::uint64_t> classification_failures_{0};
};

} // namespace emby_fast
