#include "bytesrepr/uref.hpp"

#include <algorithm>
#include <format>

namespace clw::bytesrepr {

auto AccessRights::from_bits(std::uint8_t bits) -> Expected<AccessRights> {
  if ((bits & ~kReadAddWrite) != 0) {
    return tl::unexpected(make_error(ErrorCode::FormattingError,
                                     std::format("invalid access rights {:#04x}", bits)));
  }
  return AccessRights(bits);
}

auto AccessRights::name() const -> std::string_view {
  switch (bits_) {
    case kNone:
      return "NONE";
    case kRead:
      return "READ";
    case kWrite:
      return "WRITE";
    case kAdd:
      return "ADD";
    case kReadAdd:
      return "READ_ADD";
    case kReadWrite:
      return "READ_WRITE";
    case kAddWrite:
      return "ADD_WRITE";
    case kReadAddWrite:
      return "READ_ADD_WRITE";
    default:
      return "UNKNOWN";
  }
}

auto URef::to_string() const -> std::string {
  auto rights = rights_ ? rights_->name() : std::string_view{"NONE"};
  return std::format("uref-{}-{}", to_hex(address_), rights);
}

auto write_uref(Bytes& out, const URef& uref) -> void {
  write_raw(out, uref.address());
  if (uref.rights()) {
    write_u8(out, kOptionSome);
    write_u8(out, uref.rights()->bits());
  } else {
    write_u8(out, kOptionNone);
  }
}

auto read_address(Reader& reader) -> Expected<Address> {
  auto raw = reader.read_raw(kAddressLength);
  if (!raw) {
    return tl::unexpected(raw.error());
  }
  Address address{};
  std::copy(raw->begin(), raw->end(), address.begin());
  return address;
}

auto read_uref(Reader& reader) -> Expected<URef> {
  auto address = read_address(reader);
  if (!address) {
    return tl::unexpected(address.error());
  }
  auto flag = reader.read_u8();
  if (!flag) {
    return tl::unexpected(flag.error());
  }
  if (*flag == kOptionNone) {
    return URef(*address, std::nullopt);
  }
  if (*flag != kOptionSome) {
    return tl::unexpected(make_error(ErrorCode::FormattingError,
                                     std::format("invalid option flag {:#04x}", *flag)));
  }
  auto bits = reader.read_u8();
  if (!bits) {
    return tl::unexpected(bits.error());
  }
  auto rights = AccessRights::from_bits(*bits);
  if (!rights) {
    return tl::unexpected(rights.error());
  }
  return URef(*address, *rights);
}

} // namespace clw::bytesrepr
