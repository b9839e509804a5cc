#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace emby_fast {

class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() { reset(); }

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;
  Socket(Socket &&other) noexcept : fd_(other.release()) {}
  Socket &operator=(Socket &&other) noexcept {
    if (this != &other)
      reset(other.release());
    return *this;
  }

  int fd() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1);
  void shutdown_write();

private:
  int fd_{-1};
};

enum class IoStatus { Ok, Eof, Timeout, Cancelled, Error };

const char *io_status_name(IoStatus s);

// Blocking I/O is done in short poll slices so that a raised cancel flag is
// observed promptly.
constexpr std::chrono::milliseconds kPollSlice{200};

bool listen_tcp(const std::string &bind_address, int port, Socket &out,
                int *bound_port = nullptr, std::string *err = nullptr);
std::optional<Socket> accept_client(const Socket &listener,
                                    std::chrono::milliseconds timeout);
std::optional<Socket> connect_tcp(const std::string &host, int port,
                                  std::chrono::milliseconds timeout,
                                  std::string *err = nullptr);

// Reads at most cap bytes once data is available.
IoStatus recv_some(int fd, char *buf, std::size_t cap, std::size_t &got,
                   std::chrono::milliseconds timeout,
                   const std::atomic<bool> *cancel = nullptr);
// Writes all n bytes. The timeout applies to each stall, not the total.
IoStatus send_all(int fd, const char *data, std::size_t n,
                  std::chrono::milliseconds timeout,
                  const std::atomic<bool> *cancel = nullptr);
inline IoStatus send_all(int fd, const std::string &data,
                         std::chrono::milliseconds timeout,
                         const std::atomic<bool> *cancel = nullptr) {
  return send_all(fd, data.data(), data.size(), timeout, cancel);
}

} // namespace emby_fast
