#pragma once

#include "emby_fast/forwarder.hpp"
#include "emby_fast/router.hpp"
#include "emby_fast/socket.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace emby_fast {

struct ServerConfig {
  std::string bind_address{"0.0.0.0"};
  // 0 picks an ephemeral port; see ProxyServer::port().
  int port{8097};
  std::size_t max_connections{512};
  std::chrono::milliseconds keepalive_timeout{std::chrono::seconds(75)};
  // Time allowed to receive the rest of a head once its first byte arrived.
  std::chrono::milliseconds head_timeout{std::chrono::seconds(30)};
  std::size_t max_head_bytes{64 * 1024};
};

struct ServerStats {
  std::uint64_t connections_accepted{0};
  std::uint64_t connections_rejected{0};
  std::uint64_t requests{0};
  std::uint64_t synthesized{0};
  std::uint64_t forwarded{0};
  std::uint64_t malformed{0};
  std::uint64_t upstream_failures{0};
  std::uint64_t client_aborts{0};
  std::uint64_t response_bytes{0};
};

// Accepts client connections and serves each on its own thread. Every
// request is classified by the Router and then either answered with a
// synthesized PlaybackInfo or relayed by the Forwarder.
class ProxyServer {
public:
  ProxyServer(ServerConfig cfg, Router &router, Forwarder &forwarder,
              std::atomic<bool> &stopping);
  ~ProxyServer();

  ProxyServer(const ProxyServer &) = delete;
  ProxyServer &operator=(const ProxyServer &) = delete;

  bool start(std::string *err = nullptr);
  // Raises the stop flag, stops accepting and joins every worker.
  void stop();

  int port() const { return port_; }
  std::size_t active_connections() const { return active_.load(); }
  ServerStats stats() const;
  std::string info() const;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void accept_loop();
  void reap_workers(bool all);
  void serve(ClientConn conn);
  // Returns false when the connection must be closed afterwards.
  bool serve_request(ClientConn &conn);
  bool read_head(ClientConn &conn, HttpRequestHead &req);
  bool drain_body(ClientConn &conn, BodyFramer &body);
  void reject(ClientConn &conn, int status, const std::string &why);

  ServerConfig cfg_;
  Router &router_;
  Forwarder &forwarder_;
  std::atomic<bool> &stopping_;
  Socket listener_;
  int port_{0};
  std::thread accept_thread_;
  std::mutex workers_mu_;
  std::list<Worker> workers_;
  std::atomic<std::size_t> active_{0};

  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> connections_rejected_{0};
  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> synthesized_{0};
  std::atomic<std::uint64_t> forwarded_{0};
  std::atomic<std::uint64_t> malformed_{0};
  std::atomic<std::uint64_t> upstream_failures_{0};
  std::atomic<std::uint64_t> client_aborts_{0};
  std::atomic<std::uint64_t> response_bytes_{0};
};

} // namespace emby_fast
