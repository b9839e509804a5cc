#include "emby_fast/router.hpp"
#include "emby_fast/log.hpp"

#include <sstream>
#include <vector>

namespace emby_fast {

const char *route_decision_name(RouteDecision d) {
  return d == RouteDecision::Bypass ? "bypass" : "passthrough";
}

std::optional<PlaybackInfoMatch> match_playback_info(const std::string &method,
                                                     const std::string &target) {
  if (method != "GET" && method != "POST")
    return std::nullopt;
  std::string path = target.substr(0, target.find('?'));
  while (!path.empty() && path.back() == '/')
    path.pop_back();

  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start < path.size()) {
    auto slash = path.find('/', start);
    if (slash == std::string::npos)
      slash = path.size();
    segments.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  const auto n = segments.size();
  if (n < 3 || !iequals(segments[n - 1], "PlaybackInfo") ||
      !iequals(segments[n - 3], "Items") || segments[n - 2].empty())
    return std::nullopt;

  PlaybackInfoMatch m;
  m.item_id = segments[n - 2];
  const auto q = target.find('?');
  if (q != std::string::npos) {
    if (auto v = query_param(target.substr(q + 1), "MediaSourceId"))
      m.media_source_id = *v;
  }
  return m;
}

Router::Router(MetadataCache &cache, IMetadataSource &source,
               bool bypass_enabled)
    : cache_(cache), source_(source), bypass_enabled_(bypass_enabled) {}

RouteResult Router::classify(const HttpRequestHead &req) {
  ++classified_;
  RouteResult r;
  std::optional<PlaybackInfoMatch> m;
  if (bypass_enabled_)
    m = match_playback_info(req.method, req.target);
  if (!m) {
    ++passthrough_;
    return r;
  }
  ++matched_;
  r.matched = true;
  r.item_id = m->item_id;
  r.media_source_id = m->media_source_id;

  std::string err;
  auto info = cache_.get_or_fetch(m->item_id, source_, &err);
  if (!info) {
    ++classification_failures_;
    ++passthrough_;
    r.classification_failed = true;
    log_warn("metadata lookup for " + m->item_id +
             " failed, passing through: " + err);
    return r;
  }
  if (!info->is_strm) {
    ++passthrough_;
    return r;
  }
  ++bypassed_;
  r.decision = RouteDecision::Bypass;
  r.stream_url = info->stream_url;
  log_line(LogLevel::Info, "FAST",
           "Bypassing probe for strm file: " +
               (info->name.empty() ? m->item_id : info->name));
  return r;
}

RouterStats Router::stats() const {
  RouterStats s;
  s.classified = classified_.load();
  s.matched = matched_.load();
  s.bypassed = bypassed_.load();
  s.passthrough = passthrough_.load();
  s.classification_failures = classification_failures_.load();
  return s;
}

std::string Router::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "bypass_enabled:" << (bypass_enabled_ ? 1 : 0) << "\n";
  os << "requests_classified:" << s.classified << "\n";
  os << "playback_info_matched:" << s.matched << "\n";
  os << "bypassed:" << s.bypassed << "\n";
  os << "passthrough:" << s.passthrough << "\n";
  os << "classification_failures:" << s.classification_failures << "\n";
  return os.str();
}

} // namespace emby_fast
