#include "emby_fast/synthesizer.hpp"
#include "emby_fast/http.hpp"
#include "emby_fast/json.hpp"

#include <sstream>

namespace emby_fast {

std::string play_session_id(const std::string &item_id) {
  return "play_" + item_id;
}

std::string build_playback_info_json(const PlaybackInfoParams &params) {
  const std::string &source_id = params.media_source_id.empty()
                                     ? params.item_id
                                     : params.media_source_id;
  std::ostringstream os;
  os << "{\"MediaSources\":[{";
  os << "\"Id\":" << json_quote(source_id);
  os << ",\"ItemId\":" << json_quote(params.item_id);
  os << ",\"Protocol\":\"Http\"";
  os << ",\"Type\":\"Default\"";
  os << ",\"Container\":\"\"";
  os << ",\"Name\":" << json_quote(source_id);
  os << ",\"IsRemote\":true";
  os << ",\"SupportsDirectPlay\":true";
  os << ",\"SupportsDirectStream\":true";
  os << ",\"SupportsTranscoding\":false";
  os << ",\"IsInfiniteStream\":false";
  os << ",\"RequiresOpening\":false";
  os << ",\"RequiresClosing\":false";
  os << ",\"SupportsProbing\":false";
  os << ",\"ReadAtNativeFramerate\":false";
  os << ",\"MediaStreams\":[]";
  os << ",\"RequiredHttpHeaders\":{}";
  os << ",\"Formats\":[]";
  os << ",\"Bitrate\":null";
  os << ",\"RunTimeTicks\":null";
  os << ",\"DefaultAudioStreamIndex\":null";
  os << ",\"DefaultSubtitleStreamIndex\":null";
  if (params.stream_url) {
    os << ",\"Path\":" << json_quote(*params.stream_url);
    os << ",\"DirectStreamUrl\":" << json_quote(*params.stream_url);
  }
  os << "}]";
  os << ",\"PlaySessionId\":" << json_quote(play_session_id(params.item_id));
  os << "}";
  return os.str();
}

std::string synthesize_playback_info(const PlaybackInfoParams &params,
                                     bool keep_alive) {
  return http_response(200, "application/json; charset=utf-8",
                       build_playback_info_json(params), keep_alive,
                       {{"Cache-Control", "no-cache"}});
}

} // namespace emby_fast
