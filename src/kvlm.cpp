#include "gitling/kvlm.hpp"

#include "gitling/consts.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

namespace gitling {

namespace {

std::string replace_all(std::string_view text, std::string_view from, std::string_view to) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  for (;;) {
    const auto hit = text.find(from, pos);
    if (hit == std::string_view::npos) {
      out.append(text.substr(pos));
      return out;
    }
    out.append(text.substr(pos, hit - pos));
    out.append(to);
    pos = hit + from.size();
  }
}

} // namespace

void Kvlm::add(std::string_view key, std::string value) {
  auto it = values_.find(key);
  if (it == values_.end()) {
    keys_.emplace_back(key);
    it = values_.emplace(std::string(key), std::vector<std::string>{}).first;
  }
  it->second.push_back(std::move(value));
}

const std::vector<std::string> *Kvlm::get(std::string_view key) const {
  const auto it = values_.find(key);
  return it == values_.end() ? nullptr : &it->second;
}

std::string Kvlm::message() const {
  std::string out;
  if (const auto *parts = get("")) {
    for (const auto &p : *parts) {
      out += p;
    }
  }
  return out;
}

void Kvlm::set_message(std::string message) {
  const auto it = values_.find(std::string_view{});
  if (it == values_.end()) {
    add("", std::move(message));
    return;
  }
  it->second.assign(1, std::move(message));
}

std::string Kvlm::serialize() const {
  std::string out;
  for (const auto &key : keys_) {
    if (key.empty()) {
      continue;
    }
    for (const auto &value : values_.at(key)) {
      out += key;
      out.push_back(consts::kSpace);
      out += replace_all(value, "\n", "\n ");
      out.push_back(consts::kLF);
    }
  }
  out.push_back(consts::kLF);
  out += message();
  return out;
}

Kvlm Kvlm::parse(std::span<const std::uint8_t> raw) {
  return parse(std::string_view(reinterpret_cast<const char *>(raw.data()), raw.size()));
}

Kvlm Kvlm::parse(std::string_view raw) {
  Kvlm out;
  std::size_t pos = 0;
  for (;;) {
    const auto spc = raw.find(consts::kSpace, pos);
    const auto nl = raw.find(consts::kLF, pos);

    // No "key value" line here: the rest, after the separating blank line, is
    // the message.
    if (spc == std::string_view::npos || nl == std::string_view::npos || nl < spc ||
        spc == pos) {
      std::string_view rest = raw.substr(std::min(pos, raw.size()));
      if (!rest.empty() && rest.front() == consts::kLF) {
        rest.remove_prefix(1);
      }
      out.set_message(std::string(rest));
      return out;
    }

    const std::string_view key = raw.substr(pos, spc - pos);

    // A newline followed by a space continues the value.
    auto end = raw.find(consts::kLF, spc + 1);
    while (end != std::string_view::npos && end + 1 < raw.size() &&
           raw[end + 1] == consts::kSpace) {
      end = raw.find(consts::kLF, end + 1);
    }
    if (end == std::string_view::npos) {
      end = raw.size();
    }

    out.add(key, replace_all(raw.substr(spc + 1, end - spc - 1), "\n ", "\n"));
    pos = end + 1;
  }
}

} // namespace gitling
