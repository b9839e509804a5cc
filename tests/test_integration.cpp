#include "emby_fast/forwarder.hpp"
#include "emby_fast/json.hpp"
#include "emby_fast/metadata_cache.hpp"
#include "emby_fast/metadata_client.hpp"
#include "emby_fast/router.hpp"
#include "emby_fast/server.hpp"

#include "fake_upstream.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace emby_fast;
using emby_fast::testing::FakeUpstream;

namespace {
UpstreamTarget loopback_target(int port) {
  UpstreamTarget t;
  t.host = "127.0.0.1";
  t.port = port;
  t.api_key = "test-key";
  return t;
}

ServerConfig loopback_server() {
  ServerConfig sc;
  sc.bind_address = "127.0.0.1";
  sc.port = 0;
  return sc;
}

// Whole proxy wired in-process against an upstream on the given port.
struct ProxyHarness {
  explicit ProxyHarness(int upstream_port, bool bypass = true,
                        ServerConfig sc = loopback_server())
      : target(loopback_target(upstream_port)),
        metadata(target, MetadataClientConfig{}),
        cache(MetadataCacheConfig{}, clock), router(cache, metadata, bypass),
        forwarder(target, ForwarderConfig{}, &stopping),
        server(sc, router, forwarder, stopping) {
    std::string err;
    if (!server.start(&err))
      throw std::runtime_error("proxy start: " + err);
  }

  SteadyClock clock;
  UpstreamTarget target;
  EmbyMetadataClient metadata;
  MetadataCache cache;
  Router router;
  std::atomic<bool> stopping{false};
  Forwarder forwarder;
  ProxyServer server;
};

class TestClient {
public:
  explicit TestClient(int port) {
    auto s = connect_tcp("127.0.0.1", port, std::chrono::seconds(2));
    if (!s)
      throw std::runtime_error("cannot connect to proxy");
    sock_ = std::move(*s);
  }

  void send(const std::string &data) {
    REQUIRE(send_all(sock_.fd(), data, std::chrono::seconds(5)) ==
            IoStatus::Ok);
  }

  // Reads one response. raw receives its exact bytes, body the de-chunked
  // payload.
  std::optional<HttpResponseHead> read_response(std::string *raw = nullptr,
                                                std::string *body = nullptr,
                                                const std::string &method =
                                                    "GET") {
    HttpResponseHead head;
    while (true) {
      const auto hs = parse_response_head(buffer_, head, 64 * 1024);
      if (hs == HeadStatus::Complete)
        break;
      if (hs != HeadStatus::Incomplete || fill() != IoStatus::Ok)
        return std::nullopt;
    }
    if (raw)
      *raw += head.raw;
    if (head.status < 200)
      return head;
    auto framer = response_body_framer(method, head);
    while (true) {
      const auto k = framer.consume(buffer_.data(), buffer_.size(), body);
      if (raw)
        raw->append(buffer_, 0, k);
      buffer_.erase(0, k);
      if (framer.done())
        return head;
      if (framer.failed())
        return std::nullopt;
      const auto st = fill();
      if (st == IoStatus::Eof)
        framer.on_eof();
      else if (st != IoStatus::Ok)
        return std::nullopt;
      if (framer.done())
        return head;
    }
  }

  // Blocks until at least n unread bytes are buffered.
  bool buffer_at_least(std::size_t n) {
    while (buffer_.size() < n)
      if (fill() != IoStatus::Ok)
        return false;
    return true;
  }

  bool closed_by_peer() {
    return buffer_.empty() && fill() == IoStatus::Eof;
  }

  std::string &buffer() { return buffer_; }

  void close() { sock_.reset(); }

private:
  IoStatus fill() {
    char chunk[65536];
    std::size_t got = 0;
    const auto st = recv_some(sock_.fd(), chunk, sizeof(chunk), got,
                              std::chrono::seconds(5));
    if (st == IoStatus::Ok)
      buffer_.append(chunk, got);
    return st;
  }

  Socket sock_;
  std::string buffer_;
};

std::string get(const std::string &target, const std::string &extra = "") {
  return "GET " + target + " HTTP/1.1\r\nHost: media.example:8096\r\n" +
         extra + "\r\n";
}

std::string post_json(const std::string &target, const std::string &body,
                      const std::string &extra = "") {
  return "POST " + target +
         " HTTP/1.1\r\nHost: media.example:8096\r\n"
         "Content-Type: application/json\r\nContent-Length: " +
         std::to_string(body.size()) + "\r\n" + extra + "\r\n" + body;
}

int closed_port() {
  Socket s;
  int port = 0;
  if (!listen_tcp("127.0.0.1", 0, s, &port))
    throw std::runtime_error("no ephemeral port");
  return port;
}
} // namespace

TEST_CASE("integration: passthrough relays bytes exactly",
          "[integration][passthrough]") {
  const std::string response =
      "HTTP/1.1 200 OK\r\nX-Custom-HEADER:  spaced value\r\n"
      "Transfer-Encoding: chunked\r\nContent-Type: text/plain\r\n\r\n"
      "5;ext=1\r\nhello\r\n7\r\n, world\r\n0\r\nX-Trailer: t\r\n\r\n";
  FakeUpstream up([&](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, response);
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  const auto request =
      get("/Items/5/Similar?Limit=12", "X-Emby-Token: abc\r\nAccept: */*\r\n");
  client.send(request);
  std::string raw, body;
  auto head = client.read_response(&raw, &body);
  REQUIRE(head.has_value());
  CHECK(raw == response);
  CHECK(body == "hello, world");

  const auto seen = up.requests();
  REQUIRE(seen.size() == 1);
  CHECK(seen[0].head.raw == request);
  CHECK(seen[0].head.header("Host") ==
        std::optional<std::string>("media.example:8096"));
}

TEST_CASE("integration: error statuses and request bodies pass through",
          "[integration][passthrough]") {
  FakeUpstream up([](int fd, const HttpRequestHead &req,
                     const std::string &body) {
    if (req.method == "POST")
      FakeUpstream::send(fd, "HTTP/1.1 201 Created\r\nContent-Length: " +
                                 std::to_string(body.size()) + "\r\n\r\n" +
                                 body);
    else
      FakeUpstream::send(fd, "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n"
                             "\r\nnot found");
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  client.send(get("/Users/u1/Items/999"));
  std::string body;
  auto head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  CHECK(head->status == 404);
  CHECK(body == "not found");

  // Same connection, chunked upload.
  client.send("POST /Sessions/Playing HTTP/1.1\r\nHost: x\r\n"
              "Transfer-Encoding: chunked\r\n\r\n"
              "3\r\nabc\r\n4\r\ndefg\r\n0\r\n\r\n");
  body.clear();
  head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  CHECK(head->status == 201);
  CHECK(body == "abcdefg");
  CHECK(proxy.server.stats().forwarded == 2);
}

TEST_CASE("integration: large bodies stream before the upstream finishes",
          "[integration][streaming]") {
  constexpr std::size_t kHalf = 1024 * 1024;
  std::atomic<bool> release{false};
  FakeUpstream up([&](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, "HTTP/1.1 200 OK\r\nContent-Type: video/mp4\r\n"
                           "Content-Length: " +
                               std::to_string(2 * kHalf) + "\r\n\r\n");
    FakeUpstream::send(fd, std::string(kHalf, 'a'));
    for (int i = 0; i < 500 && !release; ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    FakeUpstream::send(fd, std::string(kHalf, 'b'));
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  client.send(get("/Videos/1/stream.mp4?Static=true"));
  // The first half arrives while the upstream is still holding the second.
  REQUIRE(client.buffer_at_least(kHalf));
  CHECK_FALSE(release.load());
  CHECK(client.buffer().find('b') == std::string::npos);
  release = true;

  std::string body;
  auto head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  REQUIRE(body.size() == 2 * kHalf);
  CHECK(body.front() == 'a');
  CHECK(body.back() == 'b');
}

TEST_CASE("integration: client hang-up mid-stream closes the upstream",
          "[integration][streaming]") {
  using namespace std::chrono;
  constexpr std::size_t kChunk = 64 * 1024;
  const auto start = steady_clock::now();
  std::atomic<long long> upstream_failed_ms{-1};
  FakeUpstream up([&](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, "HTTP/1.1 200 OK\r\nContent-Type: video/mp4\r\n"
                           "Content-Length: 1073741824\r\n\r\n");
    const std::string chunk(kChunk, 'v');
    for (int i = 0; i < 16384; ++i) {
      if (send_all(fd, chunk, seconds(10)) != IoStatus::Ok) {
        upstream_failed_ms =
            duration_cast<milliseconds>(steady_clock::now() - start).count();
        return;
      }
    }
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  client.send(get("/Videos/9/stream.mkv?Static=true"));
  REQUIRE(client.buffer_at_least(kChunk));
  const auto closed_ms =
      duration_cast<milliseconds>(steady_clock::now() - start).count();
  client.close();

  for (int i = 0; i < 300 && upstream_failed_ms < 0; ++i)
    std::this_thread::sleep_for(milliseconds(10));
  // Far below the 300s idle timeout: the relay noticed the hang-up.
  REQUIRE(upstream_failed_ms >= 0);
  CHECK(upstream_failed_ms - closed_ms < 3000);
}

TEST_CASE("integration: strm PlaybackInfo is answered without the upstream",
          "[integration][bypass]") {
  FakeUpstream up([](int fd, const HttpRequestHead &req, const std::string &) {
    if (req.target.rfind("/Items/77?", 0) == 0)
      FakeUpstream::send(fd, testing::json_response(testing::item_json(
                                 "Cloud Movie", "/mnt/cloud/movie.strm")));
    else
      FakeUpstream::send(fd, "HTTP/1.1 500 Internal Server Error\r\n"
                             "Content-Length: 0\r\n\r\n");
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  client.send(post_json("/Items/77/PlaybackInfo?UserId=u1&MediaSourceId=ms77",
                        R"({"DeviceProfile":{"Name":"Web"}})"));
  std::string body;
  auto head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  CHECK(head->status == 200);
  CHECK(find_json_string(body, "Id") == std::optional<std::string>("ms77"));
  CHECK(find_json_bool(body, "SupportsDirectPlay") ==
        std::optional<bool>(true));

  // Keep-alive: the second probe reuses the connection and the cache.
  client.send(get("/emby/Items/77/PlaybackInfo"));
  body.clear();
  head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  CHECK(head->status == 200);
  CHECK(find_json_string(body, "Id") == std::optional<std::string>("77"));

  CHECK(up.count_path_prefix("/Items/77?api_key=test-key") == 1);
  CHECK(up.count_path_prefix("/Items/77/PlaybackInfo") == 0);
  CHECK(up.count_path_prefix("/emby/") == 0);
  CHECK(proxy.server.stats().synthesized == 2);
}

TEST_CASE("integration: bypass honours Expect 100-continue",
          "[integration][bypass]") {
  FakeUpstream up([](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, testing::json_response(
                               testing::item_json("Movie", "/m/a.strm")));
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  const std::string body = R"({"MaxStreamingBitrate":1})";
  client.send("POST /Items/3/PlaybackInfo HTTP/1.1\r\nHost: x\r\n"
              "Expect: 100-continue\r\nContent-Length: " +
              std::to_string(body.size()) + "\r\n\r\n");
  auto interim = client.read_response();
  REQUIRE(interim.has_value());
  CHECK(interim->status == 100);
  client.send(body);
  auto head = client.read_response();
  REQUIRE(head.has_value());
  CHECK(head->status == 200);
}

TEST_CASE("integration: local files and failed lookups are forwarded",
          "[integration][passthrough]") {
  FakeUpstream up([](int fd, const HttpRequestHead &req, const std::string &) {
    if (req.target.rfind("/Items/10?", 0) == 0)
      FakeUpstream::send(fd, testing::json_response(testing::item_json(
                                 "Local", "/media/local.mkv")));
    else if (req.target.rfind("/Items/11?", 0) == 0)
      FakeUpstream::send(fd, "HTTP/1.1 503 Service Unavailable\r\n"
                             "Content-Length: 0\r\n\r\n");
    else
      FakeUpstream::send(fd, testing::json_response(
                                 R"({"MediaSources":[{"Id":"real"}]})"));
  });
  ProxyHarness proxy(up.port());
  TestClient client(proxy.server.port());

  for (const std::string id : {"10", "11"}) {
    client.send(post_json("/Items/" + id + "/PlaybackInfo", "{}"));
    std::string body;
    auto head = client.read_response(nullptr, &body);
    REQUIRE(head.has_value());
    CHECK(head->status == 200);
    CHECK(find_json_string(body, "Id") == std::optional<std::string>("real"));
  }
  CHECK(up.count_path_prefix("/Items/10/PlaybackInfo") == 1);
  CHECK(up.count_path_prefix("/Items/11/PlaybackInfo") == 1);
  CHECK(proxy.router.stats().classification_failures == 1);
}

TEST_CASE("integration: bypass disabled forwards every probe",
          "[integration][passthrough]") {
  FakeUpstream up([](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, testing::json_response("{}"));
  });
  ProxyHarness proxy(up.port(), false);
  TestClient client(proxy.server.port());
  client.send(post_json("/Items/77/PlaybackInfo", "{}"));
  REQUIRE(client.read_response().has_value());
  CHECK(up.count_path_prefix("/Items/77/PlaybackInfo") == 1);
  CHECK(up.count_path_prefix("/Items/77?") == 0);
}

TEST_CASE("integration: unreachable upstream yields 502 and closes",
          "[integration][errors]") {
  ProxyHarness proxy(closed_port());
  TestClient client(proxy.server.port());

  client.send(get("/System/Info"));
  std::string body;
  auto head = client.read_response(nullptr, &body);
  REQUIRE(head.has_value());
  CHECK(head->status == 502);
  CHECK(body.find("Proxy error") != std::string::npos);
  CHECK(client.closed_by_peer());
  CHECK(proxy.server.stats().upstream_failures == 1);
}

TEST_CASE("integration: malformed requests are rejected",
          "[integration][errors]") {
  FakeUpstream up([](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, testing::json_response("{}"));
  });
  ProxyHarness proxy(up.port());

  {
    TestClient client(proxy.server.port());
    client.send("GARBAGE\r\n\r\n");
    auto head = client.read_response();
    REQUIRE(head.has_value());
    CHECK(head->status == 400);
    CHECK(client.closed_by_peer());
  }
  {
    TestClient client(proxy.server.port());
    client.send("POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n"
                "Content-Length: 3\r\n\r\nabc");
    auto head = client.read_response();
    REQUIRE(head.has_value());
    CHECK(head->status == 400);
  }
  {
    TestClient client(proxy.server.port());
    client.send("POST /x HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
    auto head = client.read_response();
    REQUIRE(head.has_value());
    CHECK(head->status == 501);
  }
  {
    TestClient client(proxy.server.port());
    client.send("GET / HTTP/1.1\r\nX-Huge: " + std::string(66 * 1024, 'h') +
                "\r\n\r\n");
    auto head = client.read_response();
    REQUIRE(head.has_value());
    CHECK(head->status == 431);
  }
  CHECK(up.requests().empty());
  CHECK(proxy.server.stats().malformed == 4);
}

TEST_CASE("integration: connection limit answers 503", "[integration][limits]") {
  FakeUpstream up([](int fd, const HttpRequestHead &, const std::string &) {
    FakeUpstream::send(fd, testing::json_response("{}"));
  });
  auto sc = loopback_server();
  sc.max_connections = 1;
  ProxyHarness proxy(up.port(), true, sc);

  TestClient first(proxy.server.port());
  for (int i = 0; i < 100 && proxy.server.active_connections() < 1; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  REQUIRE(proxy.server.active_connections() == 1);

  TestClient second(proxy.server.port());
  auto head = second.read_response();
  REQUIRE(head.has_value());
  CHECK(head->status == 503);
  CHECK(proxy.server.stats().connections_rejected == 1);
}

TEST_CASE("integration: server binary serves and shuts down on SIGINT",
          "[integration][process]") {
  static int attempt = 0;
  const int port = 24000 + ((::getpid() + attempt * 137) % 20000);
  ++attempt;
  const auto upstream = "http://127.0.0.1:" + std::to_string(closed_port());
  pid_t pid = fork();
  if (pid == 0) {
    execl("./emby_fast_server", "./emby_fast_server", upstream.c_str(), "key",
          std::to_string(port).c_str(), "--log-level", "error", nullptr);
    _exit(1);
  }
  std::optional<Socket> sock;
  for (int i = 0; i < 50 && !sock; ++i) {
    sock = connect_tcp("127.0.0.1", port, std::chrono::milliseconds(200));
    if (!sock)
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  REQUIRE(sock.has_value());
  sock.reset();

  TestClient client(port);
  client.send(get("/System/Info/Public"));
  auto head = client.read_response();
  REQUIRE(head.has_value());
  CHECK(head->status == 502);

  kill(pid, SIGINT);
  int status = 0;
  waitpid(pid, &status, 0);
  CHECK(WIFEXITED(status));
  CHECK(WEXITSTATUS(status) == 0);
}
