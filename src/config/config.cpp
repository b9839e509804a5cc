#include "emby_fast/config.hpp"
#include "emby_fast/json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace emby_fast {
namespace {
bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || s[0] == '-')
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_port(const std::string &s, int &out) {
  std::uint64_t v = 0;
  if (!parse_u64(s, v) || v > 65535)
    return false;
  out = static_cast<int>(v);
  return true;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}
} // namespace

bool parse_upstream_url(const std::string &url, UpstreamTarget &out,
                        std::string *err) {
  std::string rest = url;
  const auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    const auto scheme = lower(rest.substr(0, scheme_end));
    if (scheme == "https") {
      set_err(err, "https upstream is not supported (no TLS termination)");
      return false;
    }
    if (scheme != "http") {
      set_err(err, "unsupported upstream scheme: " + scheme);
      return false;
    }
    rest = rest.substr(scheme_end + 3);
  }

  const auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  std::string base = slash == std::string::npos ? "" : rest.substr(slash);
  if (base.find_first_of("?#") != std::string::npos) {
    set_err(err, "upstream url must not carry a query or fragment");
    return false;
  }
  while (!base.empty() && base.back() == '/')
    base.pop_back();

  if (authority.find('@') != std::string::npos) {
    set_err(err, "upstream url must not carry credentials");
    return false;
  }

  std::string host;
  int port = 80;
  if (!authority.empty() && authority[0] == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      set_err(err, "unterminated IPv6 literal in upstream url");
      return false;
    }
    host = authority.substr(1, close - 1);
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail[0] != ':' || !parse_port(tail.substr(1), port)) {
        set_err(err, "invalid upstream port");
        return false;
      }
    }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string::npos &&
        !parse_port(authority.substr(colon + 1), port)) {
      set_err(err, "invalid upstream port");
      return false;
    }
  }
  if (host.empty() || port == 0) {
    set_err(err, "upstream url has no host");
    return false;
  }

  out.host = host;
  out.port = port;
  out.base_path = base;
  return true;
}

bool apply_config_json(const std::string &json, ProxyConfig &cfg,
                       std::string *err) {
  if (!looks_like_json_object(json)) {
    set_err(err, "config is not a JSON object");
    return false;
  }
  ProxyConfig next = cfg;
  if (auto v = find_json_string(json, "upstream"))
    next.upstream_url = *v;
  if (auto v = find_json_string(json, "api_key"))
    next.api_key = *v;
  if (auto v = find_json_string(json, "bind"))
    next.bind_address = *v;
  if (auto v = find_json_u64(json, "port")) {
    if (*v > 65535) {
      set_err(err, "port out of range");
      return false;
    }
    next.port = static_cast<int>(*v);
  }
  if (auto v = find_json_u64(json, "cache_capacity"))
    next.cache_capacity = static_cast<std::size_t>(*v);
  if (auto v = find_json_u64(json, "cache_ttl_sec"))
    next.cache_ttl_sec = *v;
  if (auto v = find_json_u64(json, "lookup_timeout_ms"))
    next.lookup_timeout_ms = *v;
  if (auto v = find_json_u64(json, "connect_timeout_ms"))
    next.connect_timeout_ms = *v;
  if (auto v = find_json_u64(json, "response_timeout_sec"))
    next.response_timeout_sec = *v;
  if (auto v = find_json_u64(json, "idle_timeout_sec"))
    next.idle_timeout_sec = *v;
  if (auto v = find_json_u64(json, "keepalive_timeout_sec"))
    next.keepalive_timeout_sec = *v;
  if (auto v = find_json_u64(json, "max_connections"))
    next.max_connections = static_cast<std::size_t>(*v);
  if (auto v = find_json_bool(json, "resolve_stream_url"))
    next.resolve_stream_url = *v;
  if (auto v = find_json_bool(json, "bypass"))
    next.bypass_enabled = *v;
  if (auto v = find_json_string(json, "log_level")) {
    if (!parse_log_level(*v, next.log_level)) {
      set_err(err, "invalid log_level: " + *v);
      return false;
    }
  }
  cfg = next;
  return true;
}

bool load_config_file(const std::string &path, ProxyConfig &cfg,
                      std::string *err) {
  std::ifstream in(path);
  if (!in) {
    set_err(err, "cannot open config file: " + path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return apply_config_json(ss.str(), cfg, err);
}

bool parse_args(int argc, char **argv, ProxyConfig &cfg, std::string *err) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (!load_config_file(argv[i + 1], cfg, err))
        return false;
    }
  }

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need_value = [&](std::string &out) {
      if (i + 1 >= argc) {
        set_err(err, "missing value for " + a);
        return false;
      }
      out = argv[++i];
      return true;
    };
    auto need_u64 = [&](std::uint64_t &out) {
      std::string v;
      if (!need_value(v))
        return false;
      if (!parse_u64(v, out)) {
        set_err(err, "invalid numeric argument for " + a + ": " + v);
        return false;
      }
      return true;
    };

    std::string sval;
    std::uint64_t uval = 0;
    if (a == "--config") {
      if (!need_value(sval))
        return false;
    } else if (a == "--upstream") {
      if (!need_value(cfg.upstream_url))
        return false;
    } else if (a == "--api-key") {
      if (!need_value(cfg.api_key))
        return false;
    } else if (a == "--bind") {
      if (!need_value(cfg.bind_address))
        return false;
    } else if (a == "--port") {
      if (!need_value(sval))
        return false;
      if (!parse_port(sval, cfg.port)) {
        set_err(err, "invalid port: " + sval);
        return false;
      }
    } else if (a == "--cache-capacity") {
      if (!need_u64(uval))
        return false;
      cfg.cache_capacity = static_cast<std::size_t>(uval);
    } else if (a == "--cache-ttl-sec") {
      if (!need_u64(cfg.cache_ttl_sec))
        return false;
    } else if (a == "--lookup-timeout-ms") {
      if (!need_u64(cfg.lookup_timeout_ms))
        return false;
    } else if (a == "--connect-timeout-ms") {
      if (!need_u64(cfg.connect_timeout_ms))
        return false;
    } else if (a == "--response-timeout-sec") {
      if (!need_u64(cfg.response_timeout_sec))
        return false;
    } else if (a == "--idle-timeout-sec") {
      if (!need_u64(cfg.idle_timeout_sec))
        return false;
    } else if (a == "--keepalive-timeout-sec") {
      if (!need_u64(cfg.keepalive_timeout_sec))
        return false;
    } else if (a == "--max-connections") {
      if (!need_u64(uval))
        return false;
      cfg.max_connections = static_cast<std::size_t>(uval);
    } else if (a == "--resolve-stream-url") {
      cfg.resolve_stream_url = true;
    } else if (a == "--no-bypass") {
      cfg.bypass_enabled = false;
    } else if (a == "--log-level") {
      if (!need_value(sval))
        return false;
      if (!parse_log_level(sval, cfg.log_level)) {
        set_err(err, "invalid log level: " + sval);
        return false;
      }
    } else if (a.rfind("--", 0) == 0) {
      set_err(err, "unknown option: " + a);
      return false;
    } else {
      positional.push_back(a);
    }
  }

  if (positional.size() > 3) {
    set_err(err, "too many positional arguments");
    return false;
  }
  if (positional.size() > 0)
    cfg.upstream_url = positional[0];
  if (positional.size() > 1)
    cfg.api_key = positional[1];
  if (positional.size() > 2 && !parse_port(positional[2], cfg.port)) {
    set_err(err, "invalid port: " + positional[2]);
    return false;
  }
  return true;
}

bool validate_config(const ProxyConfig &cfg, UpstreamTarget &target,
                     std::string *err) {
  UpstreamTarget t;
  if (!parse_upstream_url(cfg.upstream_url, t, err))
    return false;
  t.api_key = cfg.api_key;
  if (cfg.port <= 0 || cfg.port > 65535) {
    set_err(err, "listen port must be in 1..65535");
    return false;
  }
  if (cfg.cache_capacity == 0) {
    set_err(err, "cache capacity must be at least 1");
    return false;
  }
  if (cfg.cache_ttl_sec == 0) {
    set_err(err, "cache ttl must be at least 1 second");
    return false;
  }
  if (cfg.lookup_timeout_ms == 0 || cfg.connect_timeout_ms == 0 ||
      cfg.response_timeout_sec == 0 || cfg.idle_timeout_sec == 0 ||
      cfg.keepalive_timeout_sec == 0) {
    set_err(err, "timeouts must be positive");
    return false;
  }
  if (cfg.max_connections == 0) {
    set_err(err, "max connections must be at least 1");
    return false;
  }
  target = t;
  return true;
}

std::string usage() {
  return "usage: emby_fast_server [upstream_url] [api_key] [port]\n"
         "  --upstream URL            upstream base url (http://localhost:8096)\n"
         "  --api-key KEY             API key for metadata lookups\n"
         "  --port N                  listen port (8097)\n"
         "  --bind ADDR               listen address (0.0.0.0)\n"
         "  --config FILE             JSON config file\n"
         "  --cache-capacity N        metadata cache entries (4096)\n"
         "  --cache-ttl-sec N         metadata cache ttl (300)\n"
         "  --lookup-timeout-ms N     metadata lookup timeout (5000)\n"
         "  --connect-timeout-ms N    upstream connect timeout (5000)\n"
         "  --response-timeout-sec N  wait for upstream response head (120)\n"
         "  --idle-timeout-sec N      stalled body transfer timeout (300)\n"
         "  --keepalive-timeout-sec N idle client connection timeout (75)\n"
         "  --max-connections N       concurrent client connections (512)\n"
         "  --resolve-stream-url      read strm targets for DirectStreamUrl\n"
         "  --no-bypass               forward every request unchanged\n"
         "  --log-level LEVEL         debug|info|warn|error (info)\n";
}

} // namespace emby_fast
