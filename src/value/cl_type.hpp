#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "bytesrepr/bytesrepr.hpp"
#include "value/type_hash.hpp"
#include "value/type_tag.hpp"

namespace clw::value {

class TaggedValue;

/// Type path as a tree: a tag plus exactly child_count(tag) nested types.
class CLType {
 public:
  /// Leaf type. Throws std::invalid_argument for constructor tags.
  explicit CLType(TypeTag tag);

  static auto bool_() -> CLType { return CLType(TypeTag::Bool); }
  static auto i32() -> CLType { return CLType(TypeTag::I32); }
  static auto i64() -> CLType { return CLType(TypeTag::I64); }
  static auto u8() -> CLType { return CLType(TypeTag::U8); }
  static auto u32() -> CLType { return CLType(TypeTag::U32); }
  static auto u64() -> CLType { return CLType(TypeTag::U64); }
  static auto u128() -> CLType { return CLType(TypeTag::U128); }
  static auto u256() -> CLType { return CLType(TypeTag::U256); }
  static auto u512() -> CLType { return CLType(TypeTag::U512); }
  static auto unit() -> CLType { return CLType(TypeTag::Unit); }
  static auto string() -> CLType { return CLType(TypeTag::String); }
  static auto key() -> CLType { return CLType(TypeTag::Key); }
  static auto uref() -> CLType { return CLType(TypeTag::Uref); }
  static auto any() -> CLType { return CLType(TypeTag::Any); }

  static auto option(CLType inner) -> CLType;
  static auto list(CLType element) -> CLType;
  static auto fixed_list(CLType element) -> CLType;
  static auto result(CLType ok, CLType err) -> CLType;
  static auto map(CLType key, CLType value) -> CLType;
  static auto tuple1(CLType first) -> CLType;
  static auto tuple2(CLType first, CLType second) -> CLType;
  static auto tuple3(CLType first, CLType second, CLType third) -> CLType;

  /// Rebuild a type from its flattened tag bytes; the whole input must be used.
  static auto parse(std::span<const std::uint8_t> bytes) -> Expected<CLType>;
  /// Read one complete type path from the reader, leaving any trailing bytes.
  static auto read(bytesrepr::Reader& reader) -> Expected<CLType>;

  auto tag() const -> TypeTag { return tag_; }
  auto children() const -> const std::vector<CLType>& { return children_; }
  auto child(std::size_t index) const -> const CLType& { return children_.at(index); }

  /// Pre-order tag bytes, outermost first.
  auto to_bytes() const -> bytesrepr::Bytes;
  auto append_bytes(bytesrepr::Bytes& out) const -> void;

  auto to_string() const -> std::string;

  auto fingerprint() const -> TypeDigest;

  auto operator==(const CLType&) const -> bool = default;

 private:
  friend class TaggedValue;

  CLType(TypeTag tag, std::vector<CLType> children);

  /// Single tag without arity checks; an option may name a bare constructor tag.
  static auto raw_tag(TypeTag tag) -> CLType { return CLType(tag, {}); }

  static auto read_at_depth(bytesrepr::Reader& reader, std::size_t depth) -> Expected<CLType>;

  TypeTag tag_;
  std::vector<CLType> children_;
};

} // namespace clw::value
