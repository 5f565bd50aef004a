#include "value/tagged_value.hpp"

#include "common/logging/log.hpp"

namespace clw::value {

namespace detail {

auto check_option_type(const CLType& wrapped, const CLType& supplied) -> void {
  if (wrapped != supplied) {
    log::warn("option element type {} does not match wrapped type {}",
              supplied.to_string(), wrapped.to_string());
  }
}

auto check_option_tag(const CLType& wrapped, TypeTag supplied) -> void {
  if (is_constructor(supplied)) {
    log::warn("option element tag {} is a constructor; the type path [Option, {}] is incomplete",
              tag_name(supplied), tag_name(supplied));
  } else if (wrapped.tag() != supplied) {
    log::warn("option element tag {} does not match wrapped type {}",
              tag_name(supplied), wrapped.to_string());
  }
}

} // namespace detail

auto TaggedValue::from_bool(bool value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_bool(payload, value);
  return TaggedValue(std::move(payload), CLType::bool_());
}

auto TaggedValue::from_i32(std::int32_t value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_i32_le(payload, value);
  return TaggedValue(std::move(payload), CLType::i32());
}

auto TaggedValue::from_i64(std::int64_t value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_i64_le(payload, value);
  return TaggedValue(std::move(payload), CLType::i64());
}

auto TaggedValue::from_u8(std::uint8_t value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u8(payload, value);
  return TaggedValue(std::move(payload), CLType::u8());
}

auto TaggedValue::from_u32(std::uint32_t value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u32_le(payload, value);
  return TaggedValue(std::move(payload), CLType::u32());
}

auto TaggedValue::from_u64(std::uint64_t value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u64_le(payload, value);
  return TaggedValue(std::move(payload), CLType::u64());
}

auto TaggedValue::from_u128(const bytesrepr::U128& value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u128(payload, value);
  return TaggedValue(std::move(payload), CLType::u128());
}

auto TaggedValue::from_u256(const bytesrepr::U256& value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u256(payload, value);
  return TaggedValue(std::move(payload), CLType::u256());
}

auto TaggedValue::from_u512(const bytesrepr::U512& value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_u512(payload, value);
  return TaggedValue(std::move(payload), CLType::u512());
}

auto TaggedValue::from_unit() -> TaggedValue {
  return TaggedValue(bytesrepr::Bytes{}, CLType::unit());
}

auto TaggedValue::from_string(std::string_view value) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_string(payload, value);
  return TaggedValue(std::move(payload), CLType::string());
}

auto TaggedValue::from_key(const bytesrepr::Key& key) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_key(payload, key);
  return TaggedValue(std::move(payload), CLType::key());
}

auto TaggedValue::from_uref(const bytesrepr::URef& uref) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_uref(payload, uref);
  return TaggedValue(std::move(payload), CLType::uref());
}

auto TaggedValue::from_string_list(std::span<const std::string> values) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_string_list(payload, values);
  return TaggedValue(std::move(payload), CLType::list(CLType::string()));
}

auto TaggedValue::from_byte_list(std::span<const std::uint8_t> values) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_byte_list(payload, values);
  return TaggedValue(std::move(payload), CLType::list(CLType::u8()));
}

auto TaggedValue::from_key_map(const std::map<std::string, bytesrepr::Key>& entries) -> TaggedValue {
  bytesrepr::Bytes payload;
  bytesrepr::write_length(payload, entries.size());
  for (const auto& [name, key] : entries) {
    bytesrepr::write_string(payload, name);
    bytesrepr::write_key(payload, key);
  }
  return TaggedValue(std::move(payload), CLType::map(CLType::string(), CLType::key()));
}

auto TaggedValue::from_wire(std::span<const std::uint8_t> wire) -> Expected<TaggedValue> {
  bytesrepr::Reader reader(wire);
  auto payload = reader.read_byte_list();
  if (!payload) {
    log::debug("wire value payload unreadable: {}", payload.error().message);
    return tl::unexpected(payload.error());
  }
  auto type = CLType::parse(reader.rest());
  if (!type) {
    log::debug("wire value type path unreadable: {}", type.error().message);
    return tl::unexpected(type.error());
  }
  return TaggedValue(std::move(*payload), std::move(*type));
}

auto TaggedValue::to_wire() const -> bytesrepr::Bytes {
  bytesrepr::Bytes out;
  out.reserve(4 + payload_.size() + 1);
  bytesrepr::write_byte_list(out, payload_);
  type_.append_bytes(out);
  return out;
}

} // namespace clw::value
