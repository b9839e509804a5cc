#include "emby_fast/json.hpp"

#include <cctype>
#include <cstdio>
#include <regex>

namespace emby_fast {
namespace {
std::string escape_regex(const std::string &key) {
  std::string out;
  for (char c : key) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_')
      out.push_back(c);
    else {
      out.push_back('\\');
      out.push_back(c);
    }
  }
  return out;
}

void append_utf8(std::string &out, unsigned cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string unescape(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 >= s.size()) {
      out.push_back(s[i]);
      continue;
    }
    const char c = s[++i];
    switch (c) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < s.size()) {
        try {
          append_utf8(out, static_cast<unsigned>(
                               std::stoul(s.substr(i + 1, 4), nullptr, 16)));
        } catch (const std::exception &) {
          out += "\\u" + s.substr(i + 1, 4);
        }
        i += 4;
      }
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}
} // namespace

std::optional<std::string> find_json_string(const std::string &json,
                                            const std::string &key) {
  std::regex re("\"" + escape_regex(key) +
                "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return unescape(m[1].str());
}

std::optional<std::uint64_t> find_json_u64(const std::string &json,
                                           const std::string &key) {
  std::regex re("\"" + escape_regex(key) + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  try {
    return static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<bool> find_json_bool(const std::string &json,
                                   const std::string &key) {
  std::regex re("\"" + escape_regex(key) + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(json, m, re))
    return std::nullopt;
  return m[1].str() == "true";
}

bool looks_like_json_object(const std::string &text) {
  auto b = text.find_first_not_of(" \t\r\n");
  auto e = text.find_last_not_of(" \t\r\n");
  return b != std::string::npos && text[b] == '{' && text[e] == '}';
}

std::string top_level_json(const std::string &json) {
  std::string out;
  out.reserve(json.size());
  int depth = 0;
  bool in_string = false;
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (depth <= 1)
        out.push_back(c);
      if (c == '\\' && i + 1 < json.size()) {
        if (depth <= 1)
          out.push_back(json[i + 1]);
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{' || c == '[') {
      if (++depth == 2)
        out += "null";
      if (depth > 1)
        continue;
    } else if (c == '}' || c == ']') {
      if (depth-- > 1)
        continue;
    }
    if (depth <= 1)
      out.push_back(c);
  }
  return out;
}

std::string json_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  return out;
}

std::string json_quote(const std::string &s) {
  return "\"" + json_escape(s) + "\"";
}

} // namespace emby_fast
