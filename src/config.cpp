#include "gitling/config.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/util.hpp"

#include <charconv>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace gitling {

namespace {

// "section.key" -> value, keys lowercased as git does.
using IniValues = std::map<std::string, std::string>;

IniValues parse_ini(const std::string &text) {
  IniValues out;
  std::istringstream iss(text);
  std::string section;
  std::string line;
  while (std::getline(iss, line)) {
    const std::string sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#' || sv[0] == ';') {
      continue;
    }
    if (sv.front() == '[') {
      const auto close = sv.find(']');
      if (close == std::string::npos) {
        throw Error(ErrorCode::BadConfig, "config: unterminated section header: " + sv);
      }
      section = strutil::to_lower(strutil::trim(std::string_view(sv).substr(1, close - 1)));
      continue;
    }
    const auto eq = sv.find('=');
    std::string key = strutil::to_lower(strutil::trim(std::string_view(sv).substr(0, eq)));
    std::string value =
        eq == std::string::npos ? "true" : strutil::trim(std::string_view(sv).substr(eq + 1));
    out[section + "." + key] = std::move(value);
  }
  return out;
}

std::optional<bool> parse_bool(std::string_view v) {
  const std::string s = strutil::to_lower(v);
  if (s == "true" || s == "yes" || s == "on" || s == "1") {
    return true;
  }
  if (s == "false" || s == "no" || s == "off" || s == "0") {
    return false;
  }
  return std::nullopt;
}

} // namespace

Config load_config(const std::filesystem::path &config_path) {
  std::vector<std::uint8_t> bytes;
  try {
    bytes = fs::read_file(config_path);
  } catch (const Error &e) {
    throw Error(ErrorCode::BadConfig, "config: cannot read " + config_path.string() + ": " + e.what());
  }
  const auto values = parse_ini(std::string(bytes.begin(), bytes.end()));

  const std::string version_key =
      std::string(consts::kCoreSection) + "." + std::string(consts::kFormatVersion);
  const auto it = values.find(version_key);
  if (it == values.end()) {
    throw Error(ErrorCode::BadConfig, "config: missing " + version_key + " in " +
                                          config_path.string());
  }

  Config cfg{};
  const std::string &v = it->second;
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), cfg.repository_format_version);
  if (ec != std::errc{} || ptr != v.data() + v.size()) {
    throw Error(ErrorCode::BadConfig, "config: " + version_key + " is not an integer: " + v);
  }

  if (const auto f = values.find("core.filemode"); f != values.end()) {
    cfg.filemode = parse_bool(f->second).value_or(false);
  }
  if (const auto b = values.find("core.bare"); b != values.end()) {
    cfg.bare = parse_bool(b->second).value_or(false);
  }
  return cfg;
}

std::string format_config(const Config &config) {
  std::ostringstream os;
  os << '[' << consts::kCoreSection << "]\n"
     << consts::kFormatVersion << " = " << config.repository_format_version << '\n'
     << "filemode = " << (config.filemode ? "true" : "false") << '\n'
     << "bare = " << (config.bare ? "true" : "false") << '\n';
  return os.str();
}

} // namespace gitling
