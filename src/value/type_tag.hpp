#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "common/error.hpp"

namespace clw::value {

/// Wire tag of a type or type constructor. Values are persisted and must never change.
enum class TypeTag : std::uint8_t {
  Bool = 0,
  I32 = 1,
  I64 = 2,
  U8 = 3,
  U32 = 4,
  U64 = 5,
  U128 = 6,
  U256 = 7,
  U512 = 8,
  Unit = 9,
  String = 10,
  Key = 11,
  Uref = 12,
  Option = 13,
  List = 14,
  FixedList = 15,
  Result = 16,
  Map = 17,
  Tuple1 = 18,
  Tuple2 = 19,
  Tuple3 = 20,
  Any = 21,
};

inline constexpr auto kMaxTypeTag = TypeTag::Any;

constexpr auto to_byte(TypeTag tag) -> std::uint8_t {
  return static_cast<std::uint8_t>(tag);
}

/// Number of nested type paths that follow the tag on the wire.
constexpr auto child_count(TypeTag tag) -> std::size_t {
  switch (tag) {
    case TypeTag::Option:
    case TypeTag::List:
    case TypeTag::FixedList:
    case TypeTag::Tuple1:
      return 1;
    case TypeTag::Result:
    case TypeTag::Map:
    case TypeTag::Tuple2:
      return 2;
    case TypeTag::Tuple3:
      return 3;
    default:
      return 0;
  }
}

constexpr auto is_constructor(TypeTag tag) -> bool {
  return child_count(tag) != 0;
}

auto tag_name(TypeTag tag) -> std::string_view;

auto tag_from_byte(std::uint8_t byte) -> Expected<TypeTag>;

} // namespace clw::value
