#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace emby_fast {

struct HttpHeader {
  std::string name;
  std::string value;
};

using HttpHeaders = std::vector<HttpHeader>;

// Case-insensitive; returns the first occurrence.
std::optional<std::string> find_header(const HttpHeaders &headers,
                                       const std::string &name);
// True when a comma-separated header (all occurrences) lists token.
bool header_has_token(const HttpHeaders &headers, const std::string &name,
                      const std::string &token);

struct HttpRequestHead {
  std::string method;
  std::string target;
  std::string version;
  HttpHeaders headers;
  // Exact bytes of the head as received, terminating blank line included.
  std::string raw;

  std::string path() const;
  std::string query() const;
  std::optional<std::string> header(const std::string &name) const {
    return find_header(headers, name);
  }
  bool keep_alive() const;
  bool expects_continue() const;
};

struct HttpResponseHead {
  std::string version;
  int status{0};
  std::string reason;
  HttpHeaders headers;
  std::string raw;

  std::optional<std::string> header(const std::string &name) const {
    return find_header(headers, name);
  }
  bool keep_alive() const;
};

enum class HeadStatus { Incomplete, Complete, Malformed, TooLarge };

// On Complete the head bytes are removed from the front of buffer; whatever
// follows (body bytes, a pipelined request) is left in place.
HeadStatus parse_request_head(std::string &buffer, HttpRequestHead &out,
                              std::size_t max_head_bytes,
                              std::string *err = nullptr);
HeadStatus parse_response_head(std::string &buffer, HttpResponseHead &out,
                               std::size_t max_head_bytes,
                               std::string *err = nullptr);

// Tracks where a message body ends without altering its bytes.
class BodyFramer {
public:
  enum class Mode { None, Length, Chunked, UntilClose };

  static BodyFramer none() { return BodyFramer(Mode::None, 0); }
  static BodyFramer length(std::uint64_t n) {
    return BodyFramer(Mode::Length, n);
  }
  static BodyFramer chunked() { return BodyFramer(Mode::Chunked, 0); }
  static BodyFramer until_close() { return BodyFramer(Mode::UntilClose, 0); }

  BodyFramer() : BodyFramer(Mode::None, 0) {}

  // Returns how many leading bytes of data belong to this body. Stops at the
  // end of the message. When payload is set, the de-chunked content bytes
  // are appended to it.
  std::size_t consume(const char *data, std::size_t n,
                      std::string *payload = nullptr);
  // Marks the end of the stream for close-delimited bodies.
  void on_eof();

  bool done() const { return state_ == State::Done; }
  bool failed() const { return state_ == State::Failed; }
  Mode mode() const { return mode_; }
  const std::string &error() const { return error_; }

private:
  enum class State {
    Size,
    Ext,
    SizeLF,
    Data,
    DataCR,
    DataLF,
    TrailerStart,
    TrailerLine,
    TrailerLF,
    Body,
    Done,
    Failed
  };

  BodyFramer(Mode mode, std::uint64_t length);
  void fail(const std::string &why);
  void end_size_line();

  Mode mode_;
  State state_;
  std::uint64_t remaining_{0};
  bool saw_digit_{false};
  std::string error_;
};

// Request framing per RFC 7230 3.3.3. On failure status carries the reply
// code to send back (400 or 501).
bool request_body_framer(const HttpRequestHead &req, BodyFramer &out,
                         int *status, std::string *err = nullptr);
BodyFramer response_body_framer(const std::string &request_method,
                                const HttpResponseHead &resp);

std::string reason_phrase(int status);
std::string http_response(int status, const std::string &content_type,
                          const std::string &body, bool keep_alive,
                          const HttpHeaders &extra = {});
std::string http_error_response(int status, const std::string &message);

std::string to_lower(std::string s);
bool iequals(const std::string &a, const std::string &b);
std::string url_decode(const std::string &s);
std::string url_encode(const std::string &s);
// Case-insensitive name match; the value is percent-decoded.
std::optional<std::string> query_param(const std::string &query,
                                       const std::string &name);

} // namespace emby_fast
