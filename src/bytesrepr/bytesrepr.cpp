#include "bytesrepr/bytesrepr.hpp"

#include <array>
#include <format>
#include <limits>
#include <stdexcept>

namespace clw::bytesrepr {
namespace {

auto early_end(std::size_t wanted, std::size_t available) -> Error {
  return make_error(ErrorCode::EarlyEndOfStream,
                    std::format("need {} bytes, {} remaining", wanted, available));
}

auto hex_digit(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

auto write_bool(Bytes& out, bool value) -> void {
  out.push_back(value ? std::uint8_t{1} : std::uint8_t{0});
}

auto write_u8(Bytes& out, std::uint8_t value) -> void {
  out.push_back(value);
}

auto write_u32_le(Bytes& out, std::uint32_t value) -> void {
  std::array<std::uint8_t, 4> bytes{
      static_cast<std::uint8_t>(value & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu),
      static_cast<std::uint8_t>((value >> 24) & 0xFFu)};
  out.insert(out.end(), bytes.begin(), bytes.end());
}

auto write_u64_le(Bytes& out, std::uint64_t value) -> void {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
  }
}

auto write_i32_le(Bytes& out, std::int32_t value) -> void {
  write_u32_le(out, static_cast<std::uint32_t>(value));
}

auto write_i64_le(Bytes& out, std::int64_t value) -> void {
  write_u64_le(out, static_cast<std::uint64_t>(value));
}

auto write_length(Bytes& out, std::size_t length) -> void {
  if (length > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("bytesrepr length exceeds u32");
  }
  write_u32_le(out, static_cast<std::uint32_t>(length));
}

auto write_string(Bytes& out, std::string_view value) -> void {
  write_length(out, value.size());
  out.insert(out.end(), value.begin(), value.end());
}

auto write_string_list(Bytes& out, std::span<const std::string> values) -> void {
  write_length(out, values.size());
  for (const auto& value : values) {
    write_string(out, value);
  }
}

auto write_byte_list(Bytes& out, std::span<const std::uint8_t> values) -> void {
  write_length(out, values.size());
  write_raw(out, values);
}

auto write_raw(Bytes& out, std::span<const std::uint8_t> values) -> void {
  out.insert(out.end(), values.begin(), values.end());
}

auto Reader::read_raw(std::size_t count) -> Expected<std::span<const std::uint8_t>> {
  if (count > remaining()) {
    return tl::unexpected(early_end(count, remaining()));
  }
  auto view = input_.subspan(offset_, count);
  offset_ += count;
  return view;
}

auto Reader::read_bool() -> Expected<bool> {
  auto byte = read_u8();
  if (!byte) {
    return tl::unexpected(byte.error());
  }
  switch (*byte) {
    case 0:
      return false;
    case 1:
      return true;
    default:
      return tl::unexpected(make_error(ErrorCode::FormattingError,
                                       std::format("invalid bool byte {:#04x}", *byte)));
  }
}

auto Reader::read_u8() -> Expected<std::uint8_t> {
  auto raw = read_raw(1);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  return (*raw)[0];
}

auto Reader::read_u32() -> Expected<std::uint32_t> {
  auto raw = read_raw(4);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    value |= static_cast<std::uint32_t>((*raw)[i]) << (i * 8);
  }
  return value;
}

auto Reader::read_u64() -> Expected<std::uint64_t> {
  auto raw = read_raw(8);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value |= static_cast<std::uint64_t>((*raw)[i]) << (i * 8);
  }
  return value;
}

auto Reader::read_i32() -> Expected<std::int32_t> {
  return read_u32().map([](std::uint32_t v) { return static_cast<std::int32_t>(v); });
}

auto Reader::read_i64() -> Expected<std::int64_t> {
  return read_u64().map([](std::uint64_t v) { return static_cast<std::int64_t>(v); });
}

auto Reader::read_string() -> Expected<std::string> {
  auto length = read_u32();
  if (!length) {
    return tl::unexpected(length.error());
  }
  auto raw = read_raw(*length);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  return std::string(raw->begin(), raw->end());
}

auto Reader::read_string_list() -> Expected<std::vector<std::string>> {
  auto count = read_u32();
  if (!count) {
    return tl::unexpected(count.error());
  }
  std::vector<std::string> values;
  // Every element needs at least its own length prefix.
  if (*count > remaining() / 4) {
    return tl::unexpected(early_end(static_cast<std::size_t>(*count) * 4, remaining()));
  }
  values.reserve(*count);
  for (std::uint32_t i = 0; i < *count; ++i) {
    auto value = read_string();
    if (!value) {
      return tl::unexpected(value.error());
    }
    values.push_back(std::move(*value));
  }
  return values;
}

auto Reader::read_byte_list() -> Expected<Bytes> {
  auto length = read_u32();
  if (!length) {
    return tl::unexpected(length.error());
  }
  auto raw = read_raw(*length);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  return Bytes(raw->begin(), raw->end());
}

auto Reader::finish() const -> Expected<void> {
  if (remaining() != 0) {
    return tl::unexpected(make_error(ErrorCode::LeftOverBytes,
                                     std::format("{} trailing bytes", remaining())));
  }
  return {};
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string text;
  text.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    text.push_back(kDigits[byte >> 4]);
    text.push_back(kDigits[byte & 0x0F]);
  }
  return text;
}

auto from_hex(std::string_view text) -> Expected<Bytes> {
  if (text.starts_with("0x") || text.starts_with("0X")) {
    text.remove_prefix(2);
  }
  if (text.size() % 2 != 0) {
    return tl::unexpected(make_error(ErrorCode::InvalidArgument, "hex string has odd length"));
  }
  Bytes bytes;
  bytes.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    auto hi = hex_digit(text[i]);
    auto lo = hex_digit(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return tl::unexpected(make_error(ErrorCode::InvalidArgument,
                                       std::format("invalid hex digit at offset {}", i)));
    }
    bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return bytes;
}

} // namespace clw::bytesrepr
