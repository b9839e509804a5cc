#pragma once

#include "emby_fast/http.hpp"
#include "emby_fast/socket.hpp"
#include "emby_fast/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace emby_fast {

// A client connection plus the bytes already read from it but not consumed.
struct ClientConn {
  Socket socket;
  std::string buffer;
};

struct ForwarderConfig {
  std::chrono::milliseconds connect_timeout{5000};
  // Wait for the upstream response head once the request is sent.
  std::chrono::milliseconds response_timeout{std::chrono::seconds(120)};
  // Longest stall tolerated while streaming a body in either direction.
  std::chrono::milliseconds idle_timeout{std::chrono::seconds(300)};
  std::size_t max_head_bytes{64 * 1024};
  std::size_t chunk_bytes{64 * 1024};
};

struct RelayOutcome {
  bool keep_alive{false};
  int status{0};
  bool upstream_failed{false};
  bool client_aborted{false};
  bool upgraded{false};
  std::uint64_t request_body_bytes{0};
  std::uint64_t response_bytes{0};
};

// Relays one request to the upstream and its response back. Head bytes are
// passed through verbatim and bodies are streamed chunk by chunk in arrival
// order; framing headers are only read to find where a message ends.
class Forwarder {
public:
  Forwarder(UpstreamTarget target, ForwarderConfig cfg,
            const std::atomic<bool> *stopping = nullptr);

  RelayOutcome relay(ClientConn &client, const HttpRequestHead &req,
                     BodyFramer request_body);

  const UpstreamTarget &target() const { return target_; }

private:
  struct Exchange;

  bool pump_request_body(Exchange &ex);
  bool read_final_head(Exchange &ex);
  void relay_response_body(Exchange &ex);
  void tunnel(Exchange &ex);
  void fail_before_response(Exchange &ex, int status, const std::string &why);
  bool to_client(Exchange &ex, const char *data, std::size_t n);

  UpstreamTarget target_;
  ForwarderConfig cfg_;
  const std::atomic<bool> *stopping_;
};

} // namespace emby_fast
