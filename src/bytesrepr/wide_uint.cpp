#include "bytesrepr/wide_uint.hpp"

#include <format>

namespace clw::bytesrepr {
namespace {

template <typename UInt>
auto write_wide(Bytes& out, UInt value) -> void {
  Bytes magnitude;
  while (value != 0) {
    magnitude.push_back(static_cast<std::uint8_t>(UInt(value & 0xFF)));
    value >>= 8;
  }
  write_u8(out, static_cast<std::uint8_t>(magnitude.size()));
  write_raw(out, magnitude);
}

template <typename UInt>
auto read_wide(Reader& reader, std::size_t width_bytes) -> Expected<UInt> {
  auto count = reader.read_u8();
  if (!count) {
    return tl::unexpected(count.error());
  }
  if (*count > width_bytes) {
    return tl::unexpected(make_error(
        ErrorCode::FormattingError,
        std::format("{} significant bytes exceed {}-byte width", *count, width_bytes)));
  }
  auto raw = reader.read_raw(*count);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  UInt value = 0;
  for (auto it = raw->rbegin(); it != raw->rend(); ++it) {
    value <<= 8;
    value |= *it;
  }
  return value;
}

} // namespace

auto write_u128(Bytes& out, const U128& value) -> void { write_wide(out, value); }
auto write_u256(Bytes& out, const U256& value) -> void { write_wide(out, value); }
auto write_u512(Bytes& out, const U512& value) -> void { write_wide(out, value); }

auto read_u128(Reader& reader) -> Expected<U128> { return read_wide<U128>(reader, 16); }
auto read_u256(Reader& reader) -> Expected<U256> { return read_wide<U256>(reader, 32); }
auto read_u512(Reader& reader) -> Expected<U512> { return read_wide<U512>(reader, 64); }

auto parse_u512(std::string_view text) -> Expected<U512> {
  if (text.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidArgument, "empty integer literal"));
  }
  const U512 max = ~U512(0);
  U512 value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return tl::unexpected(make_error(ErrorCode::InvalidArgument,
                                       std::format("invalid digit '{}' in '{}'", c, text)));
    }
    const unsigned digit = static_cast<unsigned>(c - '0');
    if (value > (max - digit) / 10) {
      return tl::unexpected(make_error(ErrorCode::InvalidArgument,
                                       std::format("'{}' does not fit in 512 bits", text)));
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace clw::bytesrepr
