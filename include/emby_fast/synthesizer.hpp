#pragma once

#include <optional>
#include <string>

namespace emby_fast {

struct PlaybackInfoParams {
  std::string item_id;
  // Falls back to item_id when empty.
  std::string media_source_id;
  std::optional<std::string> stream_url;
};

// PlaybackInfo document with one directly playable media source and every
// probe-derived field left empty or null.
std::string build_playback_info_json(const PlaybackInfoParams &params);

// Complete HTTP/1.1 200 response carrying build_playback_info_json.
std::string synthesize_playback_info(const PlaybackInfoParams &params,
                                     bool keep_alive);

std::string play_session_id(const std::string &item_id);

} // namespace emby_fast
