#pragma once
#include <filesystem>
#include <string>

namespace gitling {

struct Config {
  int repository_format_version = 0;
  bool filemode = false;
  bool bare = false;
};

// Parse <gitdir>/config. Throws BadConfig if the file cannot be read or
// core.repositoryformatversion is missing or not an integer.
Config load_config(const std::filesystem::path &config_path);

// INI text for `config`, one "key = value" line per field under [core].
std::string format_config(const Config &config);

} // namespace gitling
