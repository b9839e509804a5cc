#include "emby_fast/socket.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace emby_fast {
namespace {
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

bool set_nonblocking(int fd, bool on) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return fcntl(fd, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)) == 0;
}

bool cancelled(const std::atomic<bool> *cancel) {
  return cancel != nullptr && cancel->load();
}

// Waits for events on fd in slices; returns revents, 0 on timeout, -1 on
// cancellation or poll failure.
int wait_for(int fd, short events, std::chrono::milliseconds timeout,
             const std::atomic<bool> *cancel) {
  auto left = timeout;
  while (true) {
    if (cancelled(cancel))
      return -1;
    const auto slice = std::min(left, kPollSlice);
    pollfd p{fd, events, 0};
    const int n = ::poll(&p, 1, static_cast<int>(slice.count()));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return -1;
    }
    if (n > 0)
      return p.revents;
    left -= slice;
    if (left.count() <= 0)
      return 0;
  }
}
} // namespace

void Socket::reset(int fd) {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = fd;
}

void Socket::shutdown_write() {
  if (fd_ >= 0)
    ::shutdown(fd_, SHUT_WR);
}

const char *io_status_name(IoStatus s) {
  switch (s) {
  case IoStatus::Ok:
    return "ok";
  case IoStatus::Eof:
    return "eof";
  case IoStatus::Timeout:
    return "timeout";
  case IoStatus::Cancelled:
    return "cancelled";
  case IoStatus::Error:
    return "error";
  }
  return "unknown";
}

bool listen_tcp(const std::string &bind_address, int port, Socket &out,
                int *bound_port, std::string *err) {
  Socket s(::socket(AF_INET, SOCK_STREAM, 0));
  if (!s.valid()) {
    set_err(err, std::string("socket failed: ") + std::strerror(errno));
    return false;
  }
  int one = 1;
  setsockopt(s.fd(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
    set_err(err, "invalid bind address: " + bind_address);
    return false;
  }
  if (bind(s.fd(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    set_err(err, std::string("bind failed: ") + std::strerror(errno));
    return false;
  }
  if (listen(s.fd(), 128) < 0) {
    set_err(err, std::string("listen failed: ") + std::strerror(errno));
    return false;
  }
  if (bound_port) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    getsockname(s.fd(), reinterpret_cast<sockaddr *>(&actual), &len);
    *bound_port = ntohs(actual.sin_port);
  }
  out = std::move(s);
  return true;
}

std::optional<Socket> accept_client(const Socket &listener,
                                    std::chrono::milliseconds timeout) {
  pollfd p{listener.fd(), POLLIN, 0};
  if (::poll(&p, 1, static_cast<int>(timeout.count())) <= 0)
    return std::nullopt;
  Socket c(::accept(listener.fd(), nullptr, nullptr));
  if (!c.valid())
    return std::nullopt;
  int one = 1;
  setsockopt(c.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return c;
}

std::optional<Socket> connect_tcp(const std::string &host, int port,
                                  std::chrono::milliseconds timeout,
                                  std::string *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const auto service = std::to_string(port);
  const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    set_err(err, "resolve " + host + " failed: " + gai_strerror(rc));
    return std::nullopt;
  }

  std::string last_err = "no address for " + host;
  std::optional<Socket> connected;
  for (addrinfo *ai = res; ai != nullptr && !connected; ai = ai->ai_next) {
    Socket s(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!s.valid() || !set_nonblocking(s.fd(), true)) {
      last_err = std::string("socket failed: ") + std::strerror(errno);
      continue;
    }
    if (::connect(s.fd(), ai->ai_addr, ai->ai_addrlen) < 0 &&
        errno != EINPROGRESS) {
      last_err = std::string("connect failed: ") + std::strerror(errno);
      continue;
    }
    pollfd p{s.fd(), POLLOUT, 0};
    const int n = ::poll(&p, 1, static_cast<int>(timeout.count()));
    if (n <= 0) {
      last_err = n == 0 ? "connect timed out"
                        : std::string("poll failed: ") + std::strerror(errno);
      continue;
    }
    int so_err = 0;
    socklen_t len = sizeof(so_err);
    getsockopt(s.fd(), SOL_SOCKET, SO_ERROR, &so_err, &len);
    if (so_err != 0) {
      last_err = std::string("connect failed: ") + std::strerror(so_err);
      continue;
    }
    set_nonblocking(s.fd(), false);
    int one = 1;
    setsockopt(s.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    connected = std::move(s);
  }
  freeaddrinfo(res);
  if (!connected)
    set_err(err, last_err);
  return connected;
}

IoStatus recv_some(int fd, char *buf, std::size_t cap, std::size_t &got,
                   std::chrono::milliseconds timeout,
                   const std::atomic<bool> *cancel) {
  got = 0;
  while (true) {
    const int ev = wait_for(fd, POLLIN, timeout, cancel);
    if (ev < 0)
      return cancelled(cancel) ? IoStatus::Cancelled : IoStatus::Error;
    if (ev == 0)
      return IoStatus::Timeout;
    const ssize_t r = ::recv(fd, buf, cap, MSG_DONTWAIT);
    if (r > 0) {
      got = static_cast<std::size_t>(r);
      return IoStatus::Ok;
    }
    if (r == 0)
      return IoStatus::Eof;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      continue;
    return errno == ECONNRESET ? IoStatus::Eof : IoStatus::Error;
  }
}

IoStatus send_all(int fd, const char *data, std::size_t n,
                  std::chrono::milliseconds timeout,
                  const std::atomic<bool> *cancel) {
  std::size_t off = 0;
  while (off < n) {
    const int ev = wait_for(fd, POLLOUT, timeout, cancel);
    if (ev < 0)
      return cancelled(cancel) ? IoStatus::Cancelled : IoStatus::Error;
    if (ev == 0)
      return IoStatus::Timeout;
    const ssize_t w =
        ::send(fd, data + off, n - off, MSG_DONTWAIT | MSG_NOSIGNAL);
    if (w > 0) {
      off += static_cast<std::size_t>(w);
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
      continue;
    return (w < 0 && (errno == EPIPE || errno == ECONNRESET)) ? IoStatus::Eof
                                                              : IoStatus::Error;
  }
  return IoStatus::Ok;
}

} // namespace emby_fast
