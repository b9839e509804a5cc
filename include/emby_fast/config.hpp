#pragma once

#include "emby_fast/log.hpp"
#include "emby_fast/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace emby_fast {

struct ProxyConfig {
  std::string upstream_url{"http://localhost:8096"};
  std::string api_key;
  std::string bind_address{"0.0.0.0"};
  int port{8097};
  std::size_t cache_capacity{4096};
  std::uint64_t cache_ttl_sec{300};
  std::uint64_t lookup_timeout_ms{5000};
  std::uint64_t connect_timeout_ms{5000};
  std::uint64_t response_timeout_sec{120};
  std::uint64_t idle_timeout_sec{300};
  std::uint64_t keepalive_timeout_sec{75};
  std::size_t max_connections{512};
  bool resolve_stream_url{false};
  bool bypass_enabled{true};
  LogLevel log_level{LogLevel::Info};
};

bool parse_upstream_url(const std::string &url, UpstreamTarget &out,
                        std::string *err = nullptr);

// Applies the keys present in a JSON config file on top of cfg. Keys that
// are absent keep their current value.
bool load_config_file(const std::string &path, ProxyConfig &cfg,
                      std::string *err = nullptr);
bool apply_config_json(const std::string &json, ProxyConfig &cfg,
                       std::string *err = nullptr);

// Positional "upstream_url api_key port" followed by, or mixed with, flags.
// A --config file is applied first; every other flag overrides it.
bool parse_args(int argc, char **argv, ProxyConfig &cfg,
                std::string *err = nullptr);

bool validate_config(const ProxyConfig &cfg, UpstreamTarget &target,
                     std::string *err = nullptr);

std::string usage();

} // namespace emby_fast
