#include "gitling/object.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"

#include <array>
#include <type_traits>
#include <utility>

namespace gitling {

namespace {

struct KindName {
  ObjectKind kind;
  std::string_view name;
};

constexpr std::array<KindName, 4> kKindNames{{
    {ObjectKind::Blob, consts::kTypeBlob},
    {ObjectKind::Tree, consts::kTypeTree},
    {ObjectKind::Commit, consts::kTypeCommit},
    {ObjectKind::Tag, consts::kTypeTag},
}};

} // namespace

std::string_view kind_name(ObjectKind kind) {
  for (const auto &k : kKindNames) {
    if (k.kind == kind) {
      return k.name;
    }
  }
  return "unknown";
}

std::optional<ObjectKind> parse_kind(std::string_view name) {
  for (const auto &k : kKindNames) {
    if (k.name == name) {
      return k.kind;
    }
  }
  return std::nullopt;
}

// Blob

Blob Blob::deserialize(std::span<const std::uint8_t> raw) {
  return Blob{.data = {raw.begin(), raw.end()}};
}

// Tree

std::vector<std::uint8_t> Tree::serialize() const { return serialize_tree(leaves); }

Tree Tree::deserialize(std::span<const std::uint8_t> raw) {
  return Tree{.leaves = parse_tree(raw)};
}

// Commit

std::vector<std::uint8_t> Commit::serialize() const {
  const std::string text = kvlm.serialize();
  return {text.begin(), text.end()};
}

Commit Commit::deserialize(std::span<const std::uint8_t> raw) {
  return Commit{.kvlm = Kvlm::parse(raw)};
}

std::optional<std::string> Commit::tree() const {
  const auto *trees = kvlm.get(consts::kTreeKey);
  if (trees == nullptr || trees->empty()) {
    return std::nullopt;
  }
  return trees->front();
}

std::vector<std::string> Commit::parents() const {
  const auto *parents = kvlm.get(consts::kParentKey);
  return parents == nullptr ? std::vector<std::string>{} : *parents;
}

// Variant helpers

ObjectKind object_kind(const Object &obj) {
  return std::visit([](const auto &o) { return std::decay_t<decltype(o)>::kKind; }, obj);
}

std::vector<std::uint8_t> serialize_object(const Object &obj) {
  return std::visit([](const auto &o) { return o.serialize(); }, obj);
}

Object make_object(ObjectKind kind, std::span<const std::uint8_t> payload) {
  switch (kind) {
  case ObjectKind::Blob:
    return Blob::deserialize(payload);
  case ObjectKind::Tree:
    return Tree::deserialize(payload);
  case ObjectKind::Commit:
    return Commit::deserialize(payload);
  case ObjectKind::Tag:
    throw Error(ErrorCode::UnsupportedType, "tag objects are not supported");
  }
  throw Error(ErrorCode::UnknownType, "unknown object kind");
}

} // namespace gitling
