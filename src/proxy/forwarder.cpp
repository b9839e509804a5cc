#include "emby_fast/forwarder.hpp"
#include "emby_fast/log.hpp"

#include <algorithm>
#include <cerrno>
#include <poll.h>
#include <vector>

namespace emby_fast {
namespace {
enum class WaitResult { Ready, Timeout, Stopped };

// Polls two descriptors in slices until one reports an event, the timeout
// passes without activity, or the stop flag is raised.
WaitResult wait_pair(int fd_a, short ev_a, int fd_b, short ev_b,
                     std::chrono::milliseconds timeout,
                     const std::atomic<bool> *stopping, short &rev_a,
                     short &rev_b) {
  auto left = timeout;
  while (true) {
    if (stopping && stopping->load())
      return WaitResult::Stopped;
    const auto slice = std::min(left, kPollSlice);
    pollfd fds[2] = {{fd_a, ev_a, 0}, {fd_b, ev_b, 0}};
    const int n = ::poll(fds, 2, static_cast<int>(slice.count()));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return WaitResult::Stopped;
    }
    if (n > 0) {
      rev_a = fds[0].revents;
      rev_b = fds[1].revents;
      return WaitResult::Ready;
    }
    left -= slice;
    if (left.count() <= 0)
      return WaitResult::Timeout;
  }
}

constexpr short kHangup = POLLRDHUP | POLLHUP | POLLERR;

std::string describe(const HttpRequestHead &req) {
  return req.method + " " + req.target;
}
} // namespace

struct Forwarder::Exchange {
  ClientConn &client;
  const HttpRequestHead &req;
  BodyFramer request_body;
  Socket upstream;
  std::string up_buf;
  std::optional<HttpResponseHead> head;
  bool client_bytes_sent{false};
  RelayOutcome out;
};

Forwarder::Forwarder(UpstreamTarget target, ForwarderConfig cfg,
                     const std::atomic<bool> *stopping)
    : target_(std::move(target)), cfg_(cfg), stopping_(stopping) {}

bool Forwarder::to_client(Exchange &ex, const char *data, std::size_t n) {
  if (n == 0)
    return true;
  ex.client_bytes_sent = true;
  const auto st =
      send_all(ex.client.socket.fd(), data, n, cfg_.idle_timeout, stopping_);
  if (st != IoStatus::Ok) {
    ex.out.client_aborted = true;
    log_debug("client write failed (" + std::string(io_status_name(st)) +
              ") during " + describe(ex.req));
    return false;
  }
  ex.out.response_bytes += n;
  return true;
}

void Forwarder::fail_before_response(Exchange &ex, int status,
                                     const std::string &why) {
  ex.out.upstream_failed = true;
  ex.out.keep_alive = false;
  log_error("Failed to forward " + describe(ex.req) + " to " + target_.host +
            ":" + std::to_string(target_.port) + ": " + why);
  if (ex.client_bytes_sent)
    return;
  ex.out.status = status;
  const auto msg = "Proxy error: could not get a response from the media "
                   "server at " +
                   target_.host + ":" + std::to_string(target_.port) + " (" +
                   why + ")";
  const auto resp = http_error_response(status, msg);
  send_all(ex.client.socket.fd(), resp, cfg_.idle_timeout, stopping_);
}

// Streams the request body to the upstream. An interim 1xx from the upstream
// is relayed as it arrives; a final response stops the upload early.
bool Forwarder::pump_request_body(Exchange &ex) {
  auto &body = ex.request_body;
  auto send_body = [&](std::size_t n) {
    if (n == 0)
      return true;
    const auto st = send_all(ex.upstream.fd(), ex.client.buffer.data(), n,
                             cfg_.idle_timeout, stopping_);
    if (st != IoStatus::Ok)
      return false;
    ex.out.request_body_bytes += n;
    ex.client.buffer.erase(0, n);
    return true;
  };

  if (!body.done() && !ex.client.buffer.empty()) {
    const auto n = body.consume(ex.client.buffer.data(), ex.client.buffer.size());
    if (body.failed()) {
      fail_before_response(ex, 400, "malformed request body: " + body.error());
      return false;
    }
    if (!send_body(n)) {
      fail_before_response(ex, 502, "upstream closed during request body");
      return false;
    }
  }

  std::vector<char> buf(cfg_.chunk_bytes);
  while (!body.done()) {
    short rc = 0, ru = 0;
    const auto w = wait_pair(ex.client.socket.fd(), POLLIN, ex.upstream.fd(),
                             POLLIN, cfg_.idle_timeout, stopping_, rc, ru);
    if (w == WaitResult::Stopped) {
      ex.out.keep_alive = false;
      return false;
    }
    if (w == WaitResult::Timeout) {
      fail_before_response(ex, 408, "request body stalled");
      return false;
    }

    if (ru != 0) {
      std::size_t got = 0;
      const auto st = recv_some(ex.upstream.fd(), buf.data(), buf.size(), got,
                                kPollSlice, stopping_);
      if (st != IoStatus::Ok) {
        fail_before_response(ex, 502, "upstream closed during request body");
        return false;
      }
      ex.up_buf.append(buf.data(), got);
      while (true) {
        HttpResponseHead h;
        std::string perr;
        const auto hs =
            parse_response_head(ex.up_buf, h, cfg_.max_head_bytes, &perr);
        if (hs == HeadStatus::Incomplete)
          break;
        if (hs != HeadStatus::Complete) {
          fail_before_response(ex, 502, "bad upstream response: " + perr);
          return false;
        }
        if (h.status >= 200 || h.status == 101) {
          // Final answer before the upload finished; the rest of the body is
          // left unread so the client connection cannot be reused.
          ex.head = std::move(h);
          return true;
        }
        if (!to_client(ex, h.raw.data(), h.raw.size()))
          return false;
      }
    }

    if (rc != 0) {
      std::size_t got = 0;
      const auto st = recv_some(ex.client.socket.fd(), buf.data(), buf.size(),
                                got, kPollSlice, stopping_);
      if (st != IoStatus::Ok) {
        ex.out.client_aborted = true;
        log_debug("client went away during request body of " +
                  describe(ex.req));
        return false;
      }
      ex.client.buffer.append(buf.data(), got);
      const auto n =
          body.consume(ex.client.buffer.data(), ex.client.buffer.size());
      if (body.failed()) {
        fail_before_response(ex, 400,
                             "malformed request body: " + body.error());
        return false;
      }
      if (!send_body(n)) {
        fail_before_response(ex, 502, "upstream closed during request body");
        return false;
      }
    }
  }
  return true;
}

bool Forwarder::read_final_head(Exchange &ex) {
  std::vector<char> buf(cfg_.chunk_bytes);
  while (true) {
    if (!ex.head) {
      HttpResponseHead h;
      std::string perr;
      const auto hs =
          parse_response_head(ex.up_buf, h, cfg_.max_head_bytes, &perr);
      if (hs == HeadStatus::Malformed || hs == HeadStatus::TooLarge) {
        fail_before_response(ex, 502, "bad upstream response: " + perr);
        return false;
      }
      if (hs == HeadStatus::Incomplete) {
        short ru = 0, rc = 0;
        const auto w =
            wait_pair(ex.upstream.fd(), POLLIN, ex.client.socket.fd(),
                      POLLRDHUP, cfg_.response_timeout, stopping_, ru, rc);
        if (w == WaitResult::Stopped)
          return false;
        if (w == WaitResult::Timeout) {
          fail_before_response(ex, 504, "timed out waiting for response");
          return false;
        }
        if ((rc & kHangup) != 0) {
          ex.out.client_aborted = true;
          log_debug("client hung up before response to " + describe(ex.req));
          return false;
        }
        if (ru == 0)
          continue;
        std::size_t got = 0;
        const auto st = recv_some(ex.upstream.fd(), buf.data(), buf.size(),
                                  got, kPollSlice, stopping_);
        if (st != IoStatus::Ok) {
          fail_before_response(ex, 502,
                               std::string("upstream ") + io_status_name(st) +
                                   " before response");
          return false;
        }
        ex.up_buf.append(buf.data(), got);
        continue;
      }
      ex.head = std::move(h);
    }
    if (ex.head->status >= 200 || ex.head->status == 101)
      return true;
    if (!to_client(ex, ex.head->raw.data(), ex.head->raw.size()))
      return false;
    ex.head.reset();
  }
}

void Forwarder::relay_response_body(Exchange &ex) {
  auto framer = response_body_framer(ex.req.method, *ex.head);
  auto deliver = [&](const char *data, std::size_t n) {
    const auto k = framer.consume(data, n);
    return to_client(ex, data, k);
  };

  if (!deliver(ex.up_buf.data(), ex.up_buf.size()))
    return;
  ex.up_buf.clear();

  std::vector<char> buf(cfg_.chunk_bytes);
  while (!framer.done() && !framer.failed()) {
    short ru = 0, rc = 0;
    const auto w = wait_pair(ex.upstream.fd(), POLLIN, ex.client.socket.fd(),
                             POLLRDHUP, cfg_.idle_timeout, stopping_, ru, rc);
    if (w != WaitResult::Ready) {
      if (w == WaitResult::Timeout)
        log_warn("upstream body stalled for " + describe(ex.req));
      return;
    }
    if ((rc & kHangup) != 0) {
      ex.out.client_aborted = true;
      log_debug("client disconnected mid-stream for " + describe(ex.req));
      return;
    }
    if (ru == 0)
      continue;
    std::size_t got = 0;
    const auto st = recv_some(ex.upstream.fd(), buf.data(), buf.size(), got,
                              kPollSlice, stopping_);
    if (st == IoStatus::Eof) {
      framer.on_eof();
      break;
    }
    if (st != IoStatus::Ok) {
      log_warn("upstream read failed during " + describe(ex.req));
      return;
    }
    if (!deliver(buf.data(), got))
      return;
  }

  if (framer.failed()) {
    log_warn("upstream body ended early for " + describe(ex.req) + ": " +
             framer.error());
    return;
  }
  ex.out.keep_alive = ex.req.keep_alive() && ex.head->keep_alive() &&
                      framer.mode() != BodyFramer::Mode::UntilClose &&
                      ex.request_body.done();
}

// After a 101 the connection carries another protocol (the WebSocket session
// channel); bytes are copied both ways until either side closes.
void Forwarder::tunnel(Exchange &ex) {
  ex.out.upgraded = true;
  if (!to_client(ex, ex.up_buf.data(), ex.up_buf.size()))
    return;
  ex.up_buf.clear();
  if (!ex.client.buffer.empty()) {
    if (send_all(ex.upstream.fd(), ex.client.buffer, cfg_.idle_timeout,
                 stopping_) != IoStatus::Ok)
      return;
    ex.client.buffer.clear();
  }

  std::vector<char> buf(cfg_.chunk_bytes);
  while (true) {
    short rc = 0, ru = 0;
    const auto w = wait_pair(ex.client.socket.fd(), POLLIN, ex.upstream.fd(),
                             POLLIN, cfg_.idle_timeout, stopping_, rc, ru);
    if (w != WaitResult::Ready)
      return;
    if (ru != 0) {
      std::size_t got = 0;
      if (recv_some(ex.upstream.fd(), buf.data(), buf.size(), got, kPollSlice,
                    stopping_) != IoStatus::Ok)
        return;
      if (!to_client(ex, buf.data(), got))
        return;
    }
    if (rc != 0) {
      std::size_t got = 0;
      if (recv_some(ex.client.socket.fd(), buf.data(), buf.size(), got,
                    kPollSlice, stopping_) != IoStatus::Ok)
        return;
      if (send_all(ex.upstream.fd(), buf.data(), got, cfg_.idle_timeout,
                   stopping_) != IoStatus::Ok)
        return;
    }
  }
}

RelayOutcome Forwarder::relay(ClientConn &client, const HttpRequestHead &req,
                              BodyFramer request_body) {
  Exchange ex{client, req, request_body, Socket(), {}, std::nullopt, false, {}};

  std::string err;
  auto up = connect_tcp(target_.host, target_.port, cfg_.connect_timeout, &err);
  if (!up) {
    fail_before_response(ex, 502, err);
    return ex.out;
  }
  ex.upstream = std::move(*up);

  if (send_all(ex.upstream.fd(), req.raw, cfg_.idle_timeout, stopping_) !=
      IoStatus::Ok) {
    fail_before_response(ex, 502, "could not send request head");
    return ex.out;
  }

  if (!pump_request_body(ex))
    return ex.out;
  if (!read_final_head(ex))
    return ex.out;

  ex.out.status = ex.head->status;
  if (!to_client(ex, ex.head->raw.data(), ex.head->raw.size()))
    return ex.out;

  if (ex.head->status == 101)
    tunnel(ex);
  else
    relay_response_body(ex);

  log_line(LogLevel::Debug, "FORWARD",
           describe(req) + " -> " + std::to_string(ex.out.status) + " (" +
               std::to_string(ex.out.response_bytes) + " bytes)");
  return ex.out;
}

} // namespace emby_fast
