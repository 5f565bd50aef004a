#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "bytesrepr/bytesrepr.hpp"

namespace clw::bytesrepr {

inline constexpr std::size_t kAddressLength = 32;

using Address = std::array<std::uint8_t, kAddressLength>;

/// Permission bits attached to a URef.
class AccessRights {
 public:
  static constexpr std::uint8_t kNone = 0b000;
  static constexpr std::uint8_t kRead = 0b001;
  static constexpr std::uint8_t kWrite = 0b010;
  static constexpr std::uint8_t kAdd = 0b100;
  static constexpr std::uint8_t kReadAdd = kRead | kAdd;
  static constexpr std::uint8_t kReadWrite = kRead | kWrite;
  static constexpr std::uint8_t kAddWrite = kAdd | kWrite;
  static constexpr std::uint8_t kReadAddWrite = kRead | kAdd | kWrite;

  AccessRights() = default;

  /// Rejects bits outside READ|WRITE|ADD.
  static auto from_bits(std::uint8_t bits) -> Expected<AccessRights>;

  auto bits() const -> std::uint8_t { return bits_; }
  auto is_readable() const -> bool { return (bits_ & kRead) == kRead; }
  auto is_writeable() const -> bool { return (bits_ & kWrite) == kWrite; }
  auto is_addable() const -> bool { return (bits_ & kAdd) == kAdd; }

  auto name() const -> std::string_view;

  auto operator==(const AccessRights&) const -> bool = default;

 private:
  explicit AccessRights(std::uint8_t bits) : bits_(bits) {}

  std::uint8_t bits_ = kNone;
};

/// Unforgeable reference: an address plus optional access rights.
class URef {
 public:
  URef() = default;
  URef(Address address, std::optional<AccessRights> rights)
      : address_(address), rights_(rights) {}

  auto address() const -> const Address& { return address_; }
  auto rights() const -> const std::optional<AccessRights>& { return rights_; }

  auto with_rights(AccessRights rights) const -> URef { return URef(address_, rights); }
  auto remove_rights() const -> URef { return URef(address_, std::nullopt); }

  /// uref-<hex address>-<rights name>
  auto to_string() const -> std::string;

  auto operator==(const URef&) const -> bool = default;

 private:
  Address address_{};
  std::optional<AccessRights> rights_;
};

auto write_uref(Bytes& out, const URef& uref) -> void;
auto read_uref(Reader& reader) -> Expected<URef>;

auto read_address(Reader& reader) -> Expected<Address>;

}  // namespace clw::bytesrepr
