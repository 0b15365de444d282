#pragma once
#include "gitling/error.hpp"
#include "gitling/kvlm.hpp"
#include "gitling/tree.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gitling {

enum class ObjectKind : std::uint8_t { Blob, Tree, Commit, Tag };

std::string_view kind_name(ObjectKind kind);
std::optional<ObjectKind> parse_kind(std::string_view name);

struct Blob {
  static constexpr ObjectKind kKind = ObjectKind::Blob;

  std::vector<std::uint8_t> data;

  [[nodiscard]] std::vector<std::uint8_t> serialize() const { return data; }
  static Blob deserialize(std::span<const std::uint8_t> raw);
};

struct Tree {
  static constexpr ObjectKind kKind = ObjectKind::Tree;

  std::vector<TreeLeaf> leaves;

  [[nodiscard]] std::vector<std::uint8_t> serialize() const;
  static Tree deserialize(std::span<const std::uint8_t> raw);
};

struct Commit {
  static constexpr ObjectKind kKind = ObjectKind::Commit;

  Kvlm kvlm;

  [[nodiscard]] std::vector<std::uint8_t> serialize() const;
  static Commit deserialize(std::span<const std::uint8_t> raw);

  // First "tree" value, if any.
  [[nodiscard]] std::optional<std::string> tree() const;
  // All "parent" values; empty for a root commit.
  [[nodiscard]] std::vector<std::string> parents() const;
};

// Annotated tags are a recognized kind without a payload codec, so they have
// no alternative here.
using Object = std::variant<Blob, Tree, Commit>;

ObjectKind object_kind(const Object &obj);
std::vector<std::uint8_t> serialize_object(const Object &obj);

// Build the variant selected by `kind` from a raw payload.
// Throws UnsupportedType for ObjectKind::Tag.
Object make_object(ObjectKind kind, std::span<const std::uint8_t> payload);

// Checked access; throws UnexpectedType naming `what` on mismatch.
template <typename T> const T &object_as(const Object &obj, std::string_view what);
template <typename T> T object_as(Object &&obj, std::string_view what);

template <typename T> const T &object_as(const Object &obj, std::string_view what) {
  if (const auto *p = std::get_if<T>(&obj)) {
    return *p;
  }
  throw Error(ErrorCode::UnexpectedType, std::string(what) + ": expected " +
                                             std::string(kind_name(T::kKind)) + ", got " +
                                             std::string(kind_name(object_kind(obj))));
}

template <typename T> T object_as(Object &&obj, std::string_view what) {
  if (auto *p = std::get_if<T>(&obj)) {
    return std::move(*p);
  }
  throw Error(ErrorCode::UnexpectedType, std::string(what) + ": expected " +
                                             std::string(kind_name(T::kKind)) + ", got " +
                                             std::string(kind_name(object_kind(obj))));
}

} // namespace gitling
