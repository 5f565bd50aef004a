#include "bytesrepr/key.hpp"

#include <format>

namespace clw::bytesrepr {

auto Key::address() const -> const Address& {
  if (const auto* uref = std::get_if<URef>(&data_)) {
    return uref->address();
  }
  return std::get<Address>(data_);
}

auto Key::to_string() const -> std::string {
  switch (kind_) {
    case KeyKind::Account:
      return std::format("account-{}", to_hex(address()));
    case KeyKind::Hash:
      return std::format("hash-{}", to_hex(address()));
    case KeyKind::Local:
      return std::format("local-{}", to_hex(address()));
    case KeyKind::URef:
      return as_uref()->to_string();
  }
  return "unknown";
}

auto write_key(Bytes& out, const Key& key) -> void {
  write_u8(out, static_cast<std::uint8_t>(key.kind()));
  if (const auto* uref = key.as_uref()) {
    write_uref(out, *uref);
  } else {
    write_raw(out, key.address());
  }
}

auto read_key(Reader& reader) -> Expected<Key> {
  auto variant = reader.read_u8();
  if (!variant) {
    return tl::unexpected(variant.error());
  }
  if (*variant > static_cast<std::uint8_t>(KeyKind::Local)) {
    return tl::unexpected(make_error(ErrorCode::FormattingError,
                                     std::format("unknown key variant {}", *variant)));
  }
  const auto kind = static_cast<KeyKind>(*variant);
  if (kind == KeyKind::URef) {
    return read_uref(reader).map(&Key::uref);
  }
  auto address = read_address(reader);
  if (!address) {
    return tl::unexpected(address.error());
  }
  if (kind == KeyKind::Account) {
    return Key::account(*address);
  }
  if (kind == KeyKind::Hash) {
    return Key::hash(*address);
  }
  return Key::local(*address);
}

} // namespace clw::bytesrepr
