#include "value/type_tag.hpp"

#include <array>
#include <format>

namespace clw::value {
namespace {

constexpr std::array<std::string_view, to_byte(kMaxTypeTag) + 1> kTagNames{
    "Bool", "I32",  "I64",    "U8",  "U32",  "U64",       "U128",   "U256",
    "U512", "Unit", "String", "Key", "URef", "Option",    "List",   "FixedList",
    "Result", "Map", "Tuple1", "Tuple2", "Tuple3", "Any"};

} // namespace

auto tag_name(TypeTag tag) -> std::string_view {
  if (tag > kMaxTypeTag) {
    return "Unknown";
  }
  return kTagNames[to_byte(tag)];
}

auto tag_from_byte(std::uint8_t byte) -> Expected<TypeTag> {
  if (byte > to_byte(kMaxTypeTag)) {
    return tl::unexpected(make_error(ErrorCode::UnknownTypeTag,
                                     std::format("unknown type tag {}", byte)));
  }
  return static_cast<TypeTag>(byte);
}

} // namespace clw::value
