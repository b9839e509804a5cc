#include "emby_fast/config.hpp"
#include "emby_fast/metadata_client.hpp"
#include "emby_fast/synthesizer.hpp"

#include <iostream>
#include <string>
#include <vector>

// Looks items up the way the proxy does and prints how each would be routed.
// Item ids come from the command line, or one per line on stdin.
int main(int argc, char **argv) {
  bool resolve = false;
  bool print_json = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--resolve")
      resolve = true;
    else if (a == "--json")
      print_json = true;
    else
      args.push_back(a);
  }
  if (args.empty()) {
    std::cerr << "usage: emby_fast_probe upstream_url [api_key] [item_id...]\n"
                 "  --resolve   also read the strm target\n"
                 "  --json      print the PlaybackInfo the proxy would send\n";
    return 2;
  }

  emby_fast::UpstreamTarget target;
  std::string err;
  if (!emby_fast::parse_upstream_url(args[0], target, &err)) {
    std::cerr << "invalid upstream url: " << err << "\n";
    return 2;
  }
  if (args.size() > 1)
    target.api_key = args[1];
  emby_fast::MetadataClientConfig cfg;
  cfg.resolve_stream_url = resolve;
  emby_fast::EmbyMetadataClient client(target, cfg);

  int failures = 0;
  auto probe = [&](const std::string &id) {
    std::string lookup_err;
    auto info = client.lookup(id, &lookup_err);
    if (!info) {
      ++failures;
      std::cout << id << " lookup_failed " << lookup_err << "\n";
      return;
    }
    std::cout << id << " " << (info->is_strm ? "bypass" : "passthrough")
              << " name=" << info->name << " path=" << info->path;
    if (info->stream_url)
      std::cout << " stream_url=" << *info->stream_url;
    std::cout << "\n";
    if (print_json && info->is_strm)
      std::cout << emby_fast::build_playback_info_json(
                       {id, "", info->stream_url})
                << "\n";
  };

  if (args.size() > 2) {
    for (std::size_t i = 2; i < args.size(); ++i)
      probe(args[i]);
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "quit")
        break;
      if (!line.empty())
        probe(line);
    }
  }
  return failures == 0 ? 0 : 1;
}
