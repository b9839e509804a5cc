#include "emby_fast/metadata_client.hpp"
#include "emby_fast/http.hpp"
#include "emby_fast/json.hpp"
#include "emby_fast/log.hpp"
#include "emby_fast/socket.hpp"

#include <algorithm>

namespace emby_fast {
namespace {
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

std::string host_header(const UpstreamTarget &t) {
  std::string host =
      t.host.find(':') != std::string::npos ? "[" + t.host + "]" : t.host;
  if (t.port != 80)
    host += ":" + std::to_string(t.port);
  return host;
}
} // namespace

EmbyMetadataClient::EmbyMetadataClient(UpstreamTarget target,
                                       MetadataClientConfig cfg)
    : target_(std::move(target)), cfg_(cfg) {}

std::string EmbyMetadataClient::with_key(const std::string &path) const {
  if (target_.api_key.empty())
    return path;
  return path + (path.find('?') == std::string::npos ? "?" : "&") +
         "api_key=" + url_encode(target_.api_key);
}

std::optional<HttpFetchResult>
EmbyMetadataClient::fetch(const std::string &path_and_query,
                          std::string *err) const {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  const auto deadline = Clock::now() + cfg_.request_timeout;
  auto remaining = [&]() {
    return std::max(milliseconds(0),
                    duration_cast<milliseconds>(deadline - Clock::now()));
  };

  auto sock = connect_tcp(target_.host, target_.port,
                          std::min(cfg_.connect_timeout, remaining()), err);
  if (!sock)
    return std::nullopt;

  std::string req = "GET " + target_.base_path + path_and_query +
                    " HTTP/1.1\r\n";
  req += "Host: " + host_header(target_) + "\r\n";
  req += "Accept: application/json\r\n";
  req += "User-Agent: emby_fast\r\n";
  req += "Connection: close\r\n\r\n";
  auto st = send_all(sock->fd(), req, remaining());
  if (st != IoStatus::Ok) {
    set_err(err, std::string("send to upstream failed: ") + io_status_name(st));
    return std::nullopt;
  }

  std::string buffer;
  HttpResponseHead head;
  char chunk[16384];
  while (true) {
    std::string perr;
    const auto hs = parse_response_head(buffer, head, 64 * 1024, &perr);
    if (hs == HeadStatus::Complete && head.status >= 200)
      break;
    if (hs == HeadStatus::Complete)
      continue;
    if (hs != HeadStatus::Incomplete) {
      set_err(err, "bad upstream response: " + perr);
      return std::nullopt;
    }
    std::size_t got = 0;
    st = recv_some(sock->fd(), chunk, sizeof(chunk), got, remaining());
    if (st != IoStatus::Ok) {
      set_err(err, std::string("upstream response head: ") +
                       io_status_name(st));
      return std::nullopt;
    }
    buffer.append(chunk, got);
  }

  HttpFetchResult result;
  result.status = head.status;
  auto framer = response_body_framer("GET", head);
  framer.consume(buffer.data(), buffer.size(), &result.body);
  while (!framer.done() && !framer.failed()) {
    if (result.body.size() > cfg_.max_body_bytes) {
      set_err(err, "upstream body exceeds limit");
      return std::nullopt;
    }
    std::size_t got = 0;
    st = recv_some(sock->fd(), chunk, sizeof(chunk), got, remaining());
    if (st == IoStatus::Eof) {
      framer.on_eof();
      break;
    }
    if (st != IoStatus::Ok) {
      set_err(err, std::string("upstream response body: ") +
                       io_status_name(st));
      return std::nullopt;
    }
    framer.consume(chunk, got, &result.body);
  }
  if (framer.failed()) {
    set_err(err, "upstream body: " + framer.error());
    return std::nullopt;
  }
  return result;
}

std::optional<ItemInfo> EmbyMetadataClient::lookup(const std::string &item_id,
                                                   std::string *err) {
  auto res = fetch(with_key("/Items/" + url_encode(item_id)), err);
  if (!res)
    return std::nullopt;
  if (res->status < 200 || res->status > 299) {
    set_err(err, "item lookup returned status " + std::to_string(res->status));
    return std::nullopt;
  }
  ItemInfo info;
  if (!parse_item_json(res->body, info, err))
    return std::nullopt;
  if (info.is_strm && cfg_.resolve_stream_url)
    info.stream_url = fetch_stream_url(item_id);
  return info;
}

std::optional<std::string>
EmbyMetadataClient::fetch_stream_url(const std::string &item_id) const {
  std::string err;
  auto res =
      fetch(with_key("/Items/" + url_encode(item_id) + "/Download"), &err);
  if (!res) {
    log_debug("strm download for " + item_id + " failed: " + err);
    return std::nullopt;
  }
  if (res->status < 200 || res->status > 299) {
    log_debug("strm download for " + item_id + " returned status " +
              std::to_string(res->status));
    return std::nullopt;
  }
  return parse_strm_content(res->body);
}

bool is_strm_path(const std::string &path) {
  static const std::string ext = ".strm";
  return path.size() >= ext.size() &&
         iequals(path.substr(path.size() - ext.size()), ext);
}

bool parse_item_json(const std::string &json, ItemInfo &out,
                     std::string *err) {
  if (!looks_like_json_object(json)) {
    set_err(err, "item payload is not a JSON object");
    return false;
  }
  // MediaSources and MediaStreams carry their own Path keys.
  const auto item = top_level_json(json);
  ItemInfo info;
  if (auto v = find_json_string(item, "Name"))
    info.name = *v;
  if (auto v = find_json_string(item, "Path"))
    info.path = *v;
  info.is_strm = is_strm_path(info.path);
  out = std::move(info);
  return true;
}

std::optional<std::string> parse_strm_content(const std::string &content) {
  std::size_t start = 0;
  if (content.rfind("\xEF\xBB\xBF", 0) == 0)
    start = 3;
  while (start < content.size()) {
    auto nl = content.find('\n', start);
    if (nl == std::string::npos)
      nl = content.size();
    auto line = content.substr(start, nl - start);
    const auto b = line.find_first_not_of(" \t\r");
    if (b != std::string::npos) {
      const auto e = line.find_last_not_of(" \t\r");
      return line.substr(b, e - b + 1);
    }
    start = nl + 1;
  }
  return std::nullopt;
}

} // namespace emby_fast
