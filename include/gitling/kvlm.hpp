#pragma once
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace gitling {

// Key-value list with message: the text format of commit objects.
// Keys may repeat; the free-text message lives under the empty key and is
// always serialized last.
class Kvlm {
public:
  void add(std::string_view key, std::string value);

  // Values recorded for `key`, or nullptr if the key was never added.
  [[nodiscard]] const std::vector<std::string> *get(std::string_view key) const;

  [[nodiscard]] const std::vector<std::string> &keys() const { return keys_; }
  [[nodiscard]] std::string message() const;
  void set_message(std::string message);

  [[nodiscard]] std::string serialize() const;
  static Kvlm parse(std::span<const std::uint8_t> raw);
  static Kvlm parse(std::string_view raw);

  bool operator==(const Kvlm &other) const = default;

private:
  std::vector<std::string> keys_; // first-seen order
  std::map<std::string, std::vector<std::string>, std::less<>> values_;
};

} // namespace gitling
