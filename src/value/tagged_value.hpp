#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bytesrepr/bytesrepr.hpp"
#include "bytesrepr/key.hpp"
#include "bytesrepr/uref.hpp"
#include "bytesrepr/wide_uint.hpp"
#include "value/cl_type.hpp"

namespace clw::value {

namespace detail {

/// Canonical encoding and type of a native value that can sit inside an option.
template <typename T>
struct ValueTraits;

template <>
struct ValueTraits<bool> {
  static auto type() -> CLType { return CLType::bool_(); }
  static auto write(bytesrepr::Bytes& out, bool v) -> void { bytesrepr::write_bool(out, v); }
};

template <>
struct ValueTraits<std::int32_t> {
  static auto type() -> CLType { return CLType::i32(); }
  static auto write(bytesrepr::Bytes& out, std::int32_t v) -> void { bytesrepr::write_i32_le(out, v); }
};

template <>
struct ValueTraits<std::int64_t> {
  static auto type() -> CLType { return CLType::i64(); }
  static auto write(bytesrepr::Bytes& out, std::int64_t v) -> void { bytesrepr::write_i64_le(out, v); }
};

template <>
struct ValueTraits<std::uint8_t> {
  static auto type() -> CLType { return CLType::u8(); }
  static auto write(bytesrepr::Bytes& out, std::uint8_t v) -> void { bytesrepr::write_u8(out, v); }
};

template <>
struct ValueTraits<std::uint32_t> {
  static auto type() -> CLType { return CLType::u32(); }
  static auto write(bytesrepr::Bytes& out, std::uint32_t v) -> void { bytesrepr::write_u32_le(out, v); }
};

template <>
struct ValueTraits<std::uint64_t> {
  static auto type() -> CLType { return CLType::u64(); }
  static auto write(bytesrepr::Bytes& out, std::uint64_t v) -> void { bytesrepr::write_u64_le(out, v); }
};

template <>
struct ValueTraits<bytesrepr::U128> {
  static auto type() -> CLType { return CLType::u128(); }
  static auto write(bytesrepr::Bytes& out, const bytesrepr::U128& v) -> void { bytesrepr::write_u128(out, v); }
};

template <>
struct ValueTraits<bytesrepr::U256> {
  static auto type() -> CLType { return CLType::u256(); }
  static auto write(bytesrepr::Bytes& out, const bytesrepr::U256& v) -> void { bytesrepr::write_u256(out, v); }
};

template <>
struct ValueTraits<bytesrepr::U512> {
  static auto type() -> CLType { return CLType::u512(); }
  static auto write(bytesrepr::Bytes& out, const bytesrepr::U512& v) -> void { bytesrepr::write_u512(out, v); }
};

template <>
struct ValueTraits<std::string> {
  static auto type() -> CLType { return CLType::string(); }
  static auto write(bytesrepr::Bytes& out, const std::string& v) -> void { bytesrepr::write_string(out, v); }
};

template <>
struct ValueTraits<bytesrepr::Key> {
  static auto type() -> CLType { return CLType::key(); }
  static auto write(bytesrepr::Bytes& out, const bytesrepr::Key& v) -> void { bytesrepr::write_key(out, v); }
};

template <>
struct ValueTraits<bytesrepr::URef> {
  static auto type() -> CLType { return CLType::uref(); }
  static auto write(bytesrepr::Bytes& out, const bytesrepr::URef& v) -> void { bytesrepr::write_uref(out, v); }
};

template <>
struct ValueTraits<std::vector<std::string>> {
  static auto type() -> CLType { return CLType::list(CLType::string()); }
  static auto write(bytesrepr::Bytes& out, const std::vector<std::string>& v) -> void {
    bytesrepr::write_string_list(out, v);
  }
};

template <typename T>
concept Encodable = requires(bytesrepr::Bytes& out, const T& v) {
  { ValueTraits<T>::type() } -> std::same_as<CLType>;
  ValueTraits<T>::write(out, v);
};

/// Logs when the caller-supplied option element type differs from the wrapped type.
auto check_option_type(const CLType& wrapped, const CLType& supplied) -> void;
auto check_option_tag(const CLType& wrapped, TypeTag supplied) -> void;

template <Encodable T>
auto encode_option(const std::optional<T>& value) -> bytesrepr::Bytes {
  bytesrepr::Bytes out;
  if (value) {
    bytesrepr::write_u8(out, bytesrepr::kOptionSome);
    ValueTraits<T>::write(out, *value);
  } else {
    bytesrepr::write_u8(out, bytesrepr::kOptionNone);
  }
  return out;
}

} // namespace detail

/// Serialized payload paired with the type path that describes it.
///
/// Instances come only from the shape-specific factories below or from
/// from_wire(), so the type path always matches how the payload was built.
class TaggedValue {
 public:
  static auto from_bool(bool value) -> TaggedValue;
  static auto from_i32(std::int32_t value) -> TaggedValue;
  static auto from_i64(std::int64_t value) -> TaggedValue;
  static auto from_u8(std::uint8_t value) -> TaggedValue;
  static auto from_u32(std::uint32_t value) -> TaggedValue;
  static auto from_u64(std::uint64_t value) -> TaggedValue;
  static auto from_u128(const bytesrepr::U128& value) -> TaggedValue;
  static auto from_u256(const bytesrepr::U256& value) -> TaggedValue;
  static auto from_u512(const bytesrepr::U512& value) -> TaggedValue;
  static auto from_unit() -> TaggedValue;
  static auto from_string(std::string_view value) -> TaggedValue;
  static auto from_key(const bytesrepr::Key& key) -> TaggedValue;
  static auto from_uref(const bytesrepr::URef& uref) -> TaggedValue;
  static auto from_string_list(std::span<const std::string> values) -> TaggedValue;
  static auto from_byte_list(std::span<const std::uint8_t> values) -> TaggedValue;
  static auto from_key_map(const std::map<std::string, bytesrepr::Key>& entries) -> TaggedValue;

  /// Option whose element type is named by the caller. The type path is
  /// always [Option, element], even when the tag disagrees with T or names a
  /// constructor; use the CLType overload to describe composite elements.
  template <detail::Encodable T>
  static auto from_option(const std::optional<T>& value, TypeTag element) -> TaggedValue {
    detail::check_option_tag(detail::ValueTraits<T>::type(), element);
    return TaggedValue(detail::encode_option(value), CLType::option(CLType::raw_tag(element)));
  }

  /// Same as above for options of composite types.
  template <detail::Encodable T>
  static auto from_option(const std::optional<T>& value, CLType element) -> TaggedValue {
    detail::check_option_type(detail::ValueTraits<T>::type(), element);
    return TaggedValue(detail::encode_option(value), CLType::option(std::move(element)));
  }

  /// Split wire bytes back into payload and type path.
  static auto from_wire(std::span<const std::uint8_t> wire) -> Expected<TaggedValue>;

  auto payload() const -> const bytesrepr::Bytes& { return payload_; }
  auto type() const -> const CLType& { return type_; }

  auto type_bytes() const -> bytesrepr::Bytes { return type_.to_bytes(); }

  /// <u32 payload length><payload><type path bytes>
  auto to_wire() const -> bytesrepr::Bytes;

  auto operator==(const TaggedValue&) const -> bool = default;

 private:
  TaggedValue(bytesrepr::Bytes payload, CLType type)
      : payload_(std::move(payload)), type_(std::move(type)) {}

  bytesrepr::Bytes payload_;
  CLType type_;
};

} // namespace clw::value
