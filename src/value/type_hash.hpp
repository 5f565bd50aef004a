#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace clw::value {

/// 128-bit digest of a flattened type path.
struct TypeDigest {
  std::array<std::uint8_t, 16> bytes{};

  auto operator==(const TypeDigest&) const -> bool = default;
};

/// Hash the wire type path bytes (BLAKE3, truncated to 128 bits).
auto hash_type_bytes(std::span<const std::uint8_t> type_bytes) -> TypeDigest;

auto to_string(const TypeDigest& digest) -> std::string;

} // namespace clw::value
