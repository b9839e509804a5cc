#include "emby_fast/server.hpp"
#include "emby_fast/log.hpp"
#include "emby_fast/synthesizer.hpp"

#include <sstream>
#include <vector>

namespace emby_fast {

ProxyServer::ProxyServer(ServerConfig cfg, Router &router, Forwarder &forwarder,
                         std::atomic<bool> &stopping)
    : cfg_(std::move(cfg)), router_(router), forwarder_(forwarder),
      stopping_(stopping) {}

ProxyServer::~ProxyServer() { stop(); }

bool ProxyServer::start(std::string *err) {
  if (!listen_tcp(cfg_.bind_address, cfg_.port, listener_, &port_, err))
    return false;
  accept_thread_ = std::thread(&ProxyServer::accept_loop, this);
  return true;
}

void ProxyServer::stop() {
  stopping_ = true;
  if (accept_thread_.joinable())
    accept_thread_.join();
  reap_workers(true);
  listener_.reset();
}

void ProxyServer::reap_workers(bool all) {
  std::list<Worker> done;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (all || it->finished->load()) {
        done.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &w : done)
    if (w.thread.joinable())
      w.thread.join();
}

void ProxyServer::accept_loop() {
  while (!stopping_) {
    reap_workers(false);
    auto client = accept_client(listener_, kPollSlice);
    if (!client)
      continue;
    if (active_.load() >= cfg_.max_connections) {
      ++connections_rejected_;
      send_all(client->fd(),
               http_error_response(503, "connection limit reached"),
               std::chrono::milliseconds(500));
      log_warn("connection limit reached, rejecting client");
      continue;
    }
    ++connections_accepted_;
    ++active_;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread t([this, finished, sock = std::move(*client)]() mutable {
      serve(ClientConn{std::move(sock), {}});
      --active_;
      finished->store(true);
    });
    std::lock_guard<std::mutex> lk(workers_mu_);
    workers_.push_back(Worker{std::move(t), finished});
  }
}

void ProxyServer::serve(ClientConn conn) {
  while (!stopping_ && serve_request(conn)) {
  }
}

void ProxyServer::reject(ClientConn &conn, int status, const std::string &why) {
  log_warn("rejecting request with " + std::to_string(status) + ": " + why);
  if (send_all(conn.socket.fd(), http_error_response(status, why),
               cfg_.head_timeout, &stopping_) != IoStatus::Ok)
    return;
  // Lingering close: input left unread at close() turns into a reset that
  // can discard the reply.
  conn.socket.shutdown_write();
  const auto deadline = Clock::now() + std::chrono::seconds(2);
  char sink[16384];
  std::size_t got = 0;
  while (Clock::now() < deadline &&
         recv_some(conn.socket.fd(), sink, sizeof(sink), got,
                   std::chrono::milliseconds(500), &stopping_) == IoStatus::Ok) {
  }
}

bool ProxyServer::read_head(ClientConn &conn, HttpRequestHead &req) {
  std::vector<char> buf(16384);
  while (true) {
    std::string err;
    const auto hs =
        parse_request_head(conn.buffer, req, cfg_.max_head_bytes, &err);
    if (hs == HeadStatus::Complete)
      return true;
    if (hs == HeadStatus::Malformed) {
      ++malformed_;
      reject(conn, 400, err);
      return false;
    }
    if (hs == HeadStatus::TooLarge) {
      ++malformed_;
      reject(conn, 431, err);
      return false;
    }
    const auto timeout =
        conn.buffer.empty() ? cfg_.keepalive_timeout : cfg_.head_timeout;
    std::size_t got = 0;
    const auto st = recv_some(conn.socket.fd(), buf.data(), buf.size(), got,
                              timeout, &stopping_);
    if (st != IoStatus::Ok) {
      if (!conn.buffer.empty())
        log_debug(std::string("client left mid-head: ") + io_status_name(st));
      return false;
    }
    conn.buffer.append(buf.data(), got);
  }
}

bool ProxyServer::drain_body(ClientConn &conn, BodyFramer &body) {
  const auto n = body.consume(conn.buffer.data(), conn.buffer.size());
  conn.buffer.erase(0, n);
  std::vector<char> buf(16384);
  while (!body.done()) {
    if (body.failed()) {
      ++malformed_;
      reject(conn, 400, "malformed request body: " + body.error());
      return false;
    }
    std::size_t got = 0;
    const auto st = recv_some(conn.socket.fd(), buf.data(), buf.size(), got,
                              cfg_.head_timeout, &stopping_);
    if (st != IoStatus::Ok)
      return false;
    const auto k = body.consume(buf.data(), got);
    conn.buffer.append(buf.data() + k, got - k);
  }
  return true;
}

bool ProxyServer::serve_request(ClientConn &conn) {
  HttpRequestHead req;
  if (!read_head(conn, req))
    return false;
  ++requests_;

  BodyFramer body;
  int status = 400;
  std::string err;
  if (!request_body_framer(req, body, &status, &err)) {
    ++malformed_;
    reject(conn, status, err);
    return false;
  }

  const auto route = router_.classify(req);
  log_debug(req.method + " " + req.target + " -> " +
            route_decision_name(route.decision));
  if (route.decision == RouteDecision::Bypass) {
    if (req.expects_continue() && !body.done() && conn.buffer.empty())
      send_all(conn.socket.fd(), std::string("HTTP/1.1 100 Continue\r\n\r\n"),
               cfg_.head_timeout, &stopping_);
    if (!drain_body(conn, body))
      return false;
    const bool keep = req.keep_alive();
    const auto resp = synthesize_playback_info(
        {route.item_id, route.media_source_id, route.stream_url}, keep);
    ++synthesized_;
    if (send_all(conn.socket.fd(), resp, cfg_.head_timeout, &stopping_) !=
        IoStatus::Ok) {
      ++client_aborts_;
      return false;
    }
    response_bytes_ += resp.size();
    return keep;
  }

  ++forwarded_;
  const auto out = forwarder_.relay(conn, req, body);
  if (out.upstream_failed)
    ++upstream_failures_;
  if (out.client_aborted)
    ++client_aborts_;
  response_bytes_ += out.response_bytes;
  return out.keep_alive;
}

ServerStats ProxyServer::stats() const {
  ServerStats s;
  s.connections_accepted = connections_accepted_.load();
  s.connections_rejected = connections_rejected_.load();
  s.requests = requests_.load();
  s.synthesized = synthesized_.load();
  s.forwarded = forwarded_.load();
  s.malformed = malformed_.load();
  s.upstream_failures = upstream_failures_.load();
  s.client_aborts = client_aborts_.load();
  s.response_bytes = response_bytes_.load();
  return s;
}

std::string ProxyServer::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "active_connections:" << active_.load() << "\n";
  os << "connections_accepted:" << s.connections_accepted << "\n";
  os << "connections_rejected:" << s.connections_rejected << "\n";
  os << "requests:" << s.requests << "\n";
  os << "synthesized:" << s.synthesized << "\n";
  os << "forwarded:" << s.forwarded << "\n";
  os << "malformed:" << s.malformed << "\n";
  os << "upstream_failures:" << s.upstream_failures << "\n";
  os << "client_aborts:" << s.client_aborts << "\n";
  os << "response_bytes:" << s.response_bytes << "\n";
  return os.str();
}

} // namespace emby_fast
