#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/error.hpp"

namespace clw::bytesrepr {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::uint8_t kOptionNone = 0x00;
inline constexpr std::uint8_t kOptionSome = 0x01;
inline constexpr std::uint8_t kResultErr = 0x00;
inline constexpr std::uint8_t kResultOk = 0x01;

auto write_bool(Bytes& out, bool value) -> void;
auto write_u8(Bytes& out, std::uint8_t value) -> void;
auto write_u32_le(Bytes& out, std::uint32_t value) -> void;
auto write_u64_le(Bytes& out, std::uint64_t value) -> void;
auto write_i32_le(Bytes& out, std::int32_t value) -> void;
auto write_i64_le(Bytes& out, std::int64_t value) -> void;

/// u32 length prefix; throws std::length_error past u32 max.
auto write_length(Bytes& out, std::size_t length) -> void;
auto write_string(Bytes& out, std::string_view value) -> void;
auto write_string_list(Bytes& out, std::span<const std::string> values) -> void;
auto write_byte_list(Bytes& out, std::span<const std::uint8_t> values) -> void;
auto write_raw(Bytes& out, std::span<const std::uint8_t> values) -> void;

/// Cursor over an encoded buffer. The buffer must outlive the reader.
class Reader {
 public:
  explicit Reader(std::span<const std::uint8_t> input) : input_(input) {}

  auto read_bool() -> Expected<bool>;
  auto read_u8() -> Expected<std::uint8_t>;
  auto read_u32() -> Expected<std::uint32_t>;
  auto read_u64() -> Expected<std::uint64_t>;
  auto read_i32() -> Expected<std::int32_t>;
  auto read_i64() -> Expected<std::int64_t>;
  auto read_string() -> Expected<std::string>;
  auto read_string_list() -> Expected<std::vector<std::string>>;
  auto read_byte_list() -> Expected<Bytes>;
  auto read_raw(std::size_t count) -> Expected<std::span<const std::uint8_t>>;

  auto remaining() const -> std::size_t { return input_.size() - offset_; }
  auto offset() const -> std::size_t { return offset_; }
  auto rest() const -> std::span<const std::uint8_t> { return input_.subspan(offset_); }

  /// Fails with LeftOverBytes unless the whole input was consumed.
  auto finish() const -> Expected<void>;

 private:
  std::span<const std::uint8_t> input_;
  std::size_t offset_ = 0;
};

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;
auto from_hex(std::string_view text) -> Expected<Bytes>;

}  // namespace clw::bytesrepr
