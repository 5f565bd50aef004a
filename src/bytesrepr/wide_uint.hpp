#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "bytesrepr/bytesrepr.hpp"

namespace clw::bytesrepr {

namespace mp = boost::multiprecision;

using U128 = mp::number<mp::cpp_int_backend<128, 128, mp::unsigned_magnitude, mp::unchecked, void>>;
using U256 = mp::number<mp::cpp_int_backend<256, 256, mp::unsigned_magnitude, mp::unchecked, void>>;
using U512 = mp::number<mp::cpp_int_backend<512, 512, mp::unsigned_magnitude, mp::unchecked, void>>;

/// Significant-byte count followed by the little-endian magnitude.
auto write_u128(Bytes& out, const U128& value) -> void;
auto write_u256(Bytes& out, const U256& value) -> void;
auto write_u512(Bytes& out, const U512& value) -> void;

auto read_u128(Reader& reader) -> Expected<U128>;
auto read_u256(Reader& reader) -> Expected<U256>;
auto read_u512(Reader& reader) -> Expected<U512>;

/// Parse a decimal string; rejects empty input, non-digits and overflow.
auto parse_u512(std::string_view text) -> Expected<U512>;

template <typename UInt>
auto to_decimal(const UInt& value) -> std::string {
  return value.str();
}

}  // namespace clw::bytesrepr
