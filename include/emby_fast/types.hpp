#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace emby_fast {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SteadyClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

struct UpstreamTarget {
  std::string host{"localhost"};
  int port{8096};
  // Path prefix of the upstream base URL, e.g. "/emby". Empty for the root.
  std::string base_path;
  std::string api_key;
};

enum class RouteDecision { Passthrough, Bypass };

const char *route_decision_name(RouteDecision d);

struct ItemInfo {
  bool is_strm{false};
  std::string name;
  std::string path;
  std::optional<std::string> stream_url;
};

} // namespace emby_fast
