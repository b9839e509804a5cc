#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace emby_fast {

// Key lookups over small JSON documents. The first occurrence of the key wins.
std::optional<std::string> find_json_string(const std::string &json,
                                            const std::string &key);
std::optional<std::uint64_t> find_json_u64(const std::string &json,
                                           const std::string &key);
std::optional<bool> find_json_bool(const std::string &json,
                                   const std::string &key);

bool looks_like_json_object(const std::string &text);

// The outermost object with every nested object or array value replaced by
// null, so the find_json_* lookups only see its own members.
std::string top_level_json(const std::string &json);

std::string json_escape(const std::string &s);
std::string json_quote(const std::string &s);

} // namespace emby_fast
