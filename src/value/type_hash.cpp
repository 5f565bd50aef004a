#include "value/type_hash.hpp"

#include "bytesrepr/bytesrepr.hpp"

extern "C" {
#include "blake3.h"
}

namespace clw::value {

auto hash_type_bytes(std::span<const std::uint8_t> type_bytes) -> TypeDigest {
  TypeDigest digest{};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, type_bytes.data(), type_bytes.size());
  blake3_hasher_finalize(&hasher, digest.bytes.data(), digest.bytes.size());
  return digest;
}

auto to_string(const TypeDigest& digest) -> std::string {
  return bytesrepr::to_hex(digest.bytes);
}

} // namespace clw::value
