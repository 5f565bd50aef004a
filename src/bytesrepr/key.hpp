#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "bytesrepr/uref.hpp"

namespace clw::bytesrepr {

enum class KeyKind : std::uint8_t {
  Account = 0,
  Hash = 1,
  URef = 2,
  Local = 3,
};

/// Address of a value in global state.
class Key {
 public:
  static auto account(Address address) -> Key { return Key(KeyKind::Account, address); }
  static auto hash(Address address) -> Key { return Key(KeyKind::Hash, address); }
  static auto local(Address address) -> Key { return Key(KeyKind::Local, address); }
  static auto uref(URef uref) -> Key { return Key(uref); }

  auto kind() const -> KeyKind { return kind_; }

  /// Address for Account, Hash and Local keys, the URef address otherwise.
  auto address() const -> const Address&;

  /// Null unless kind() is KeyKind::URef.
  auto as_uref() const -> const URef* { return std::get_if<URef>(&data_); }

  auto to_string() const -> std::string;

  auto operator==(const Key&) const -> bool = default;

 private:
  Key(KeyKind kind, Address address) : kind_(kind), data_(address) {}
  explicit Key(URef uref) : kind_(KeyKind::URef), data_(uref) {}

  KeyKind kind_;
  std::variant<Address, URef> data_;
};

auto write_key(Bytes& out, const Key& key) -> void;
auto read_key(Reader& reader) -> Expected<Key>;

}  // namespace clw::bytesrepr
