#include "emby_fast/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

namespace emby_fast {
namespace {
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

bool is_token_char(unsigned char c) {
  return std::isalnum(c) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool is_token(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return is_token_char(c);
  });
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> split_list(const std::string &s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    auto comma = s.find(',', start);
    if (comma == std::string::npos)
      comma = s.size();
    auto item = trim(s.substr(start, comma - start));
    if (!item.empty())
      out.push_back(item);
    start = comma + 1;
  }
  return out;
}

bool valid_version(const std::string &v) {
  return v == "HTTP/1.1" || v == "HTTP/1.0";
}

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

// Position just past the blank line ending the head, or npos.
std::size_t find_head_end(const std::string &buffer) {
  const auto crlf = buffer.find("\r\n\r\n");
  const auto lf = buffer.find("\n\n");
  std::size_t end = std::string::npos;
  if (crlf != std::string::npos)
    end = crlf + 4;
  if (lf != std::string::npos && lf + 2 < end)
    end = lf + 2;
  return end;
}

std::vector<std::string> split_lines(const std::string &head) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < head.size()) {
    auto nl = head.find('\n', start);
    if (nl == std::string::npos)
      nl = head.size();
    std::string line = head.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));
    start = nl + 1;
  }
  while (!lines.empty() && lines.back().empty())
    lines.pop_back();
  return lines;
}

bool parse_header_lines(const std::vector<std::string> &lines,
                        HttpHeaders &out, std::string *err) {
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto &line = lines[i];
    if (line.empty() || line[0] == ' ' || line[0] == '\t') {
      set_err(err, "folded or empty header line");
      return false;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      set_err(err, "header line without name");
      return false;
    }
    auto name = line.substr(0, colon);
    if (!is_token(name)) {
      set_err(err, "invalid header name: " + name);
      return false;
    }
    out.push_back({std::move(name), trim(line.substr(colon + 1))});
  }
  return true;
}

// Shared by request and response parsing: strips leading blank lines, finds
// the head, enforces the size cap and splits it into lines.
HeadStatus take_head(std::string &buffer, std::size_t max_head_bytes,
                     std::string &raw, std::vector<std::string> &lines,
                     std::string *err) {
  std::size_t lead = 0;
  while (lead < buffer.size() && (buffer[lead] == '\r' || buffer[lead] == '\n'))
    ++lead;
  if (lead > 0)
    buffer.erase(0, lead);
  if (buffer.empty())
    return HeadStatus::Incomplete;

  const auto end = find_head_end(buffer);
  if (end == std::string::npos) {
    if (buffer.size() > max_head_bytes) {
      set_err(err, "header section too large");
      return HeadStatus::TooLarge;
    }
    return HeadStatus::Incomplete;
  }
  if (end > max_head_bytes) {
    set_err(err, "header section too large");
    return HeadStatus::TooLarge;
  }
  raw = buffer.substr(0, end);
  lines = split_lines(raw);
  if (lines.empty()) {
    set_err(err, "empty head");
    return HeadStatus::Malformed;
  }
  buffer.erase(0, end);
  return HeadStatus::Complete;
}

std::optional<std::uint64_t> content_length(const HttpHeaders &headers,
                                            bool *invalid) {
  std::optional<std::uint64_t> result;
  *invalid = false;
  for (const auto &h : headers) {
    if (!iequals(h.name, "Content-Length"))
      continue;
    for (const auto &item : split_list(h.value)) {
      if (!all_digits(item) || item.size() > 19) {
        *invalid = true;
        return std::nullopt;
      }
      const auto v = static_cast<std::uint64_t>(std::stoull(item));
      if (result && *result != v) {
        *invalid = true;
        return std::nullopt;
      }
      result = v;
    }
  }
  return result;
}

std::vector<std::string> transfer_codings(const HttpHeaders &headers) {
  std::vector<std::string> out;
  for (const auto &h : headers) {
    if (!iequals(h.name, "Transfer-Encoding"))
      continue;
    for (auto &item : split_list(h.value))
      out.push_back(to_lower(item));
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](unsigned char x, unsigned char y) {
                      return std::tolower(x) == std::tolower(y);
                    });
}

std::optional<std::string> find_header(const HttpHeaders &headers,
                                       const std::string &name) {
  for (const auto &h : headers)
    if (iequals(h.name, name))
      return h.value;
  return std::nullopt;
}

bool header_has_token(const HttpHeaders &headers, const std::string &name,
                      const std::string &token) {
  for (const auto &h : headers) {
    if (!iequals(h.name, name))
      continue;
    for (const auto &item : split_list(h.value))
      if (iequals(item, token))
        return true;
  }
  return false;
}

std::string HttpRequestHead::path() const {
  return target.substr(0, target.find('?'));
}

std::string HttpRequestHead::query() const {
  const auto q = target.find('?');
  return q == std::string::npos ? "" : target.substr(q + 1);
}

bool HttpRequestHead::keep_alive() const {
  if (version == "HTTP/1.0")
    return header_has_token(headers, "Connection", "keep-alive");
  return !header_has_token(headers, "Connection", "close");
}

bool HttpRequestHead::expects_continue() const {
  auto e = header("Expect");
  return e && iequals(*e, "100-continue");
}

bool HttpResponseHead::keep_alive() const {
  if (version == "HTTP/1.0")
    return header_has_token(headers, "Connection", "keep-alive");
  return !header_has_token(headers, "Connection", "close");
}

HeadStatus parse_request_head(std::string &buffer, HttpRequestHead &out,
                              std::size_t max_head_bytes, std::string *err) {
  std::string raw;
  std::vector<std::string> lines;
  const auto st = take_head(buffer, max_head_bytes, raw, lines, err);
  if (st != HeadStatus::Complete)
    return st;

  const auto &rl = lines[0];
  const auto sp1 = rl.find(' ');
  const auto sp2 = sp1 == std::string::npos ? sp1 : rl.find(' ', sp1 + 1);
  if (sp1 == std::string::npos || sp2 == std::string::npos ||
      rl.find(' ', sp2 + 1) != std::string::npos) {
    set_err(err, "malformed request line");
    return HeadStatus::Malformed;
  }
  HttpRequestHead req;
  req.method = rl.substr(0, sp1);
  req.target = rl.substr(sp1 + 1, sp2 - sp1 - 1);
  req.version = rl.substr(sp2 + 1);
  if (!is_token(req.method)) {
    set_err(err, "invalid method");
    return HeadStatus::Malformed;
  }
  if (req.target.empty() ||
      std::any_of(req.target.begin(), req.target.end(),
                  [](unsigned char c) { return c <= 0x20 || c == 0x7f; })) {
    set_err(err, "invalid request target");
    return HeadStatus::Malformed;
  }
  if (!valid_version(req.version)) {
    set_err(err, "unsupported protocol version: " + req.version);
    return HeadStatus::Malformed;
  }
  if (!parse_header_lines(lines, req.headers, err))
    return HeadStatus::Malformed;
  req.raw = std::move(raw);
  out = std::move(req);
  return HeadStatus::Complete;
}

HeadStatus parse_response_head(std::string &buffer, HttpResponseHead &out,
                               std::size_t max_head_bytes, std::string *err) {
  std::string raw;
  std::vector<std::string> lines;
  const auto st = take_head(buffer, max_head_bytes, raw, lines, err);
  if (st != HeadStatus::Complete)
    return st;

  const auto &sl = lines[0];
  const auto sp1 = sl.find(' ');
  if (sp1 == std::string::npos) {
    set_err(err, "malformed status line");
    return HeadStatus::Malformed;
  }
  HttpResponseHead resp;
  resp.version = sl.substr(0, sp1);
  const auto sp2 = sl.find(' ', sp1 + 1);
  const auto code = sl.substr(sp1 + 1, sp2 == std::string::npos
                                           ? std::string::npos
                                           : sp2 - sp1 - 1);
  if (!valid_version(resp.version) || code.size() != 3 || !all_digits(code)) {
    set_err(err, "malformed status line");
    return HeadStatus::Malformed;
  }
  resp.status = std::stoi(code);
  if (resp.status < 100) {
    set_err(err, "invalid status code");
    return HeadStatus::Malformed;
  }
  resp.reason = sp2 == std::string::npos ? "" : sl.substr(sp2 + 1);
  if (!parse_header_lines(lines, resp.headers, err))
    return HeadStatus::Malformed;
  resp.raw = std::move(raw);
  out = std::move(resp);
  return HeadStatus::Complete;
}

BodyFramer::BodyFramer(Mode mode, std::uint64_t length)
    : mode_(mode), state_(State::Body), remaining_(length) {
  if (mode_ == Mode::Chunked)
    state_ = State::Size;
  else if (mode_ == Mode::None || (mode_ == Mode::Length && length == 0))
    state_ = State::Done;
}

void BodyFramer::fail(const std::string &why) {
  state_ = State::Failed;
  error_ = why;
}

void BodyFramer::end_size_line() {
  if (remaining_ == 0) {
    state_ = State::TrailerStart;
  } else {
    state_ = State::Data;
  }
}

void BodyFramer::on_eof() {
  if (state_ == State::Done || state_ == State::Failed)
    return;
  if (mode_ == Mode::UntilClose)
    state_ = State::Done;
  else
    fail("connection closed before end of body");
}

std::size_t BodyFramer::consume(const char *data, std::size_t n,
                                std::string *payload) {
  std::size_t i = 0;
  while (i < n) {
    switch (state_) {
    case State::Done:
    case State::Failed:
      return i;
    case State::Body: {
      std::size_t take = n - i;
      if (mode_ == Mode::Length) {
        take = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining_, take));
        remaining_ -= take;
      }
      if (payload)
        payload->append(data + i, take);
      i += take;
      if (mode_ == Mode::Length && remaining_ == 0)
        state_ = State::Done;
      break;
    }
    case State::Size: {
      const char c = data[i++];
      const int h = hex_value(c);
      if (h >= 0) {
        if (remaining_ > (std::numeric_limits<std::uint64_t>::max() >> 4)) {
          fail("chunk size overflow");
          break;
        }
        remaining_ = remaining_ * 16 + static_cast<std::uint64_t>(h);
        saw_digit_ = true;
      } else if (!saw_digit_) {
        fail("missing chunk size");
      } else if (c == ';' || c == ' ' || c == '\t') {
        state_ = State::Ext;
      } else if (c == '\r') {
        state_ = State::SizeLF;
      } else if (c == '\n') {
        end_size_line();
      } else {
        fail("invalid chunk size");
      }
      break;
    }
    case State::Ext: {
      const char c = data[i++];
      if (c == '\r')
        state_ = State::SizeLF;
      else if (c == '\n')
        end_size_line();
      break;
    }
    case State::SizeLF:
      if (data[i++] == '\n')
        end_size_line();
      else
        fail("expected LF after chunk size");
      break;
    case State::Data: {
      const auto take = static_cast<std::size_t>(
          std::min<std::uint64_t>(remaining_, n - i));
      if (payload)
        payload->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0)
        state_ = State::DataCR;
      break;
    }
    case State::DataCR: {
      const char c = data[i++];
      if (c == '\r') {
        state_ = State::DataLF;
      } else if (c == '\n') {
        state_ = State::Size;
        saw_digit_ = false;
      } else {
        fail("missing CRLF after chunk data");
      }
      break;
    }
    case State::DataLF:
      if (data[i++] == '\n') {
        state_ = State::Size;
        saw_digit_ = false;
      } else {
        fail("missing LF after chunk data");
      }
      break;
    case State::TrailerStart: {
      const char c = data[i++];
      if (c == '\r')
        state_ = State::TrailerLF;
      else if (c == '\n')
        state_ = State::Done;
      else
        state_ = State::TrailerLine;
      break;
    }
    case State::TrailerLine:
      if (data[i++] == '\n')
        state_ = State::TrailerStart;
      break;
    case State::TrailerLF:
      if (data[i++] == '\n')
        state_ = State::Done;
      else
        fail("malformed chunked trailer");
      break;
    }
  }
  return i;
}

bool request_body_framer(const HttpRequestHead &req, BodyFramer &out,
                         int *status, std::string *err) {
  const auto codings = transfer_codings(req.headers);
  bool cl_invalid = false;
  const auto cl = content_length(req.headers, &cl_invalid);
  if (!codings.empty()) {
    if (cl.has_value() || cl_invalid) {
      if (status)
        *status = 400;
      set_err(err, "both Transfer-Encoding and Content-Length present");
      return false;
    }
    if (codings.back() != "chunked") {
      if (status)
        *status = 501;
      set_err(err, "unsupported transfer coding: " + codings.back());
      return false;
    }
    out = BodyFramer::chunked();
    return true;
  }
  if (cl_invalid) {
    if (status)
      *status = 400;
    set_err(err, "invalid Content-Length");
    return false;
  }
  out = cl ? BodyFramer::length(*cl) : BodyFramer::none();
  return true;
}

BodyFramer response_body_framer(const std::string &request_method,
                                const HttpResponseHead &resp) {
  if (request_method == "HEAD" || resp.status < 200 || resp.status == 204 ||
      resp.status == 304)
    return BodyFramer::none();
  const auto codings = transfer_codings(resp.headers);
  if (!codings.empty())
    return codings.back() == "chunked" ? BodyFramer::chunked()
                                       : BodyFramer::until_close();
  bool invalid = false;
  const auto cl = content_length(resp.headers, &invalid);
  if (cl && !invalid)
    return BodyFramer::length(*cl);
  return BodyFramer::until_close();
}

std::string reason_phrase(int status) {
  switch (status) {
  case 100:
    return "Continue";
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 408:
    return "Request Timeout";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 501:
    return "Not Implemented";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Unknown";
  }
}

std::string http_response(int status, const std::string &content_type,
                          const std::string &body, bool keep_alive,
                          const HttpHeaders &extra) {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " +
                    reason_phrase(status) + "\r\n";
  out += "Content-Type: " + content_type + "\r\n";
  out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  for (const auto &h : extra)
    out += h.name + ": " + h.value + "\r\n";
  out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
  out += "\r\n";
  out += body;
  return out;
}

std::string http_error_response(int status, const std::string &message) {
  return http_response(status, "text/plain; charset=utf-8", message + "\n",
                       false);
}

std::string url_decode(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
        hex_value(s[i + 2]) >= 0) {
      out.push_back(
          static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
      i += 2;
    } else if (s[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::string url_encode(const std::string &s) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::optional<std::string> query_param(const std::string &query,
                                       const std::string &name) {
  std::size_t start = 0;
  while (start <= query.size()) {
    auto amp = query.find('&', start);
    if (amp == std::string::npos)
      amp = query.size();
    const auto pair = query.substr(start, amp - start);
    const auto eq = pair.find('=');
    const auto key = url_decode(pair.substr(0, eq));
    if (iequals(key, name))
      return eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
    start = amp + 1;
  }
  return std::nullopt;
}

} // namespace emby_fast
