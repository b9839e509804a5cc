#pragma once

#include "emby_fast/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace emby_fast {

// Source of item-type information. Failures are reported as an empty result
// with the reason in err; callers treat them as "upstream unavailable".
class IMetadataSource {
public:
  virtual ~IMetadataSource() = default;
  virtual std::optional<ItemInfo> lookup(const std::string &item_id,
                                         std::string *err = nullptr) = 0;
};

struct MetadataClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds request_timeout{5000};
  bool resolve_stream_url{false};
  std::size_t max_body_bytes{4 * 1024 * 1024};
};

struct HttpFetchResult {
  int status{0};
  std::string body;
};

class EmbyMetadataClient final : public IMetadataSource {
public:
  EmbyMetadataClient(UpstreamTarget target, MetadataClientConfig cfg);

  // GET {base}/Items/{id}?api_key=..; the item is a strm reference when its
  // Path ends in ".strm".
  std::optional<ItemInfo> lookup(const std::string &item_id,
                                 std::string *err = nullptr) override;

  // One-shot GET against the upstream with Connection: close.
  std::optional<HttpFetchResult> fetch(const std::string &path_and_query,
                                       std::string *err = nullptr) const;

private:
  std::optional<std::string> fetch_stream_url(const std::string &item_id) const;
  std::string with_key(const std::string &path) const;

  UpstreamTarget target_;
  MetadataClientConfig cfg_;
};

bool is_strm_path(const std::string &path);
bool parse_item_json(const std::string &json, ItemInfo &out,
                     std::string *err = nullptr);
// First non-empty line of a .strm file, trimmed.
std::optional<std::string> parse_strm_content(const std::string &content);

} // namespace emby_fast
