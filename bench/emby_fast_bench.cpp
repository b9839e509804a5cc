#include "emby_fast/log.hpp"
#include "emby_fast/metadata_cache.hpp"
#include "emby_fast/router.hpp"
#include "emby_fast/synthesizer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace emby_fast;

namespace {
// Stands in for the media server: every lookup costs a fixed delay.
class DelaySource final : public IMetadataSource {
public:
  explicit DelaySource(std::chrono::microseconds delay) : delay_(delay) {}

  std::optional<ItemInfo> lookup(const std::string &item_id,
                                 std::string *) override {
    ++calls;
    std::this_thread::sleep_for(delay_);
    ItemInfo info;
    info.name = "item " + item_id;
    info.path = "/media/" + item_id + (item_id.back() % 2 ? ".strm" : ".mkv");
    info.is_strm = is_strm_path(info.path);
    return info;
  }

  std::atomic<std::uint64_t> calls{0};

private:
  std::chrono::microseconds delay_;
};

HttpRequestHead playback_info(const std::string &id) {
  std::string buf = "POST /emby/Items/" + id +
                    "/PlaybackInfo?UserId=u HTTP/1.1\r\nHost: bench\r\n\r\n";
  HttpRequestHead req;
  parse_request_head(buf, req, 64 * 1024);
  return req;
}
} // namespace

int main() {
  set_log_level(LogLevel::Warn);
  const std::vector<std::string> presets = {"hotset", "uniform"};
  const std::vector<std::size_t> capacities = {64, 1024};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    for (const auto capacity : capacities) {
      SteadyClock clock;
      MetadataCache cache({capacity, std::chrono::minutes(5)}, clock);
      DelaySource source(std::chrono::microseconds(200));
      Router router(cache, source);
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, 1999);
      const int ops = 20000;
      std::vector<double> lat;
      lat.reserve(ops);
      std::uint64_t bypassed = 0;
      const auto start = std::chrono::steady_clock::now();
      for (int i = 0; i < ops; ++i) {
        int k = u(rng);
        if (preset == "hotset")
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        const auto req = playback_info(std::to_string(k % 2000));
        const auto t0 = std::chrono::steady_clock::now();
        const auto r = router.classify(req);
        if (r.decision == RouteDecision::Bypass) {
          ++bypassed;
          synthesize_playback_info({r.item_id, r.media_source_id, r.stream_url},
                                   true);
        }
        const auto t1 = std::chrono::steady_clock::now();
        lat.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
      const auto end = std::chrono::steady_clock::now();
      std::sort(lat.begin(), lat.end());
      auto pct = [&](double p) {
        return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
      };
      const double seconds = std::chrono::duration<double>(end - start).count();
      const auto s = cache.stats();
      std::cout << "capacity=" << capacity << " ops/s=" << std::fixed
                << std::setprecision(2) << (ops / seconds)
                << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
                << " p99_us=" << pct(0.99) << " hit_rate="
                << (static_cast<double>(s.hits) / ops)
                << " upstream_calls=" << source.calls.load()
                << " bypassed=" << bypassed << "\n";
    }
  }

  // Burst of concurrent probes for one cold item: lookups are coalesced.
  SteadyClock clock;
  MetadataCache cache({1024, std::chrono::minutes(5)}, clock);
  DelaySource source(std::chrono::milliseconds(20));
  Router router(cache, source);
  std::vector<std::thread> threads;
  for (int t = 0; t < 32; ++t)
    threads.emplace_back([&] { router.classify(playback_info("4241")); });
  for (auto &t : threads)
    t.join();
  std::cout << "burst threads=32 upstream_calls=" << source.calls.load()
            << " coalesced_waits=" << cache.stats().coalesced_waits << "\n";
  return 0;
}
