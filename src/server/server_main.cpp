#include "emby_fast/config.hpp"
#include "emby_fast/forwarder.hpp"
#include "emby_fast/log.hpp"
#include "emby_fast/metadata_cache.hpp"
#include "emby_fast/metadata_client.hpp"
#include "emby_fast/router.hpp"
#include "emby_fast/server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

void log_config(const emby_fast::ProxyConfig &cfg) {
  using emby_fast::log_line;
  using emby_fast::LogLevel;
  log_line(LogLevel::Info, "CONFIG", "Upstream: " + cfg.upstream_url);
  log_line(LogLevel::Info, "CONFIG", "API key: " + emby_fast::redact(cfg.api_key));
  log_line(LogLevel::Info, "CONFIG",
           "Listen: " + cfg.bind_address + ":" + std::to_string(cfg.port));
  log_line(LogLevel::Info, "CONFIG",
           "Metadata cache: " + std::to_string(cfg.cache_capacity) +
               " entries, ttl " + std::to_string(cfg.cache_ttl_sec) + "s");
  log_line(LogLevel::Info, "CONFIG",
           std::string("strm bypass: ") +
               (cfg.bypass_enabled ? "enabled" : "disabled") +
               (cfg.resolve_stream_url ? ", resolving stream urls" : ""));
  if (cfg.api_key.empty())
    emby_fast::log_warn("no API key set; metadata lookups may be refused and "
                        "PlaybackInfo will be forwarded");
}

void log_block(const std::string &title, const std::string &info) {
  std::istringstream in(info);
  std::string line;
  while (std::getline(in, line))
    emby_fast::log_line(emby_fast::LogLevel::Info, "STATS", title + " " + line);
}
} // namespace

int main(int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      std::cout << emby_fast::usage();
      return 0;
    }
  }

  emby_fast::ProxyConfig cfg;
  std::string err;
  if (!emby_fast::parse_args(argc, argv, cfg, &err)) {
    std::cerr << "error: " << err << "\n" << emby_fast::usage();
    return 2;
  }
  emby_fast::UpstreamTarget target;
  if (!emby_fast::validate_config(cfg, target, &err)) {
    std::cerr << "error: " << err << "\n";
    return 2;
  }
  emby_fast::set_log_level(cfg.log_level);
  log_config(cfg);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  emby_fast::MetadataClientConfig client_cfg;
  client_cfg.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
  client_cfg.request_timeout = std::chrono::milliseconds(cfg.lookup_timeout_ms);
  client_cfg.resolve_stream_url = cfg.resolve_stream_url;
  emby_fast::EmbyMetadataClient metadata(target, client_cfg);

  emby_fast::SteadyClock clock;
  emby_fast::MetadataCache cache(
      {cfg.cache_capacity, std::chrono::seconds(cfg.cache_ttl_sec)}, clock);
  emby_fast::Router router(cache, metadata, cfg.bypass_enabled);

  std::atomic<bool> stopping{false};
  emby_fast::ForwarderConfig fwd_cfg;
  fwd_cfg.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
  fwd_cfg.response_timeout = std::chrono::seconds(cfg.response_timeout_sec);
  fwd_cfg.idle_timeout = std::chrono::seconds(cfg.idle_timeout_sec);
  emby_fast::Forwarder forwarder(target, fwd_cfg, &stopping);

  emby_fast::ServerConfig srv_cfg;
  srv_cfg.bind_address = cfg.bind_address;
  srv_cfg.port = cfg.port;
  srv_cfg.max_connections = cfg.max_connections;
  srv_cfg.keepalive_timeout = std::chrono::seconds(cfg.keepalive_timeout_sec);
  emby_fast::ProxyServer server(srv_cfg, router, forwarder, stopping);
  if (!server.start(&err)) {
    emby_fast::log_error("could not listen on " + cfg.bind_address + ":" +
                         std::to_string(cfg.port) + ": " + err);
    return 1;
  }
  emby_fast::log_info("EmbyFast proxy started on port " +
                      std::to_string(server.port()));

  while (running)
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  emby_fast::log_info("shutting down");
  server.stop();
  log_block("server", server.info());
  log_block("router", router.info());
  log_block("cache", cache.info());
  return 0;
}
