#include "bytesrepr/key.hpp"
#include "bytesrepr/uref.hpp"

#include <gtest/gtest.h>

#include <string>

using clw::ErrorCode;
using clw::bytesrepr::AccessRights;
using clw::bytesrepr::Address;
using clw::bytesrepr::Bytes;
using clw::bytesrepr::Key;
using clw::bytesrepr::KeyKind;
using clw::bytesrepr::Reader;
using clw::bytesrepr::URef;

namespace {

auto filled(std::uint8_t byte) -> Address {
  Address address{};
  address.fill(byte);
  return address;
}

auto rights(std::uint8_t bits) -> AccessRights {
  return AccessRights::from_bits(bits).value();
}

} // namespace

TEST(AccessRights, Predicates) {
  ASSERT_TRUE(rights(AccessRights::kRead).is_readable());
  ASSERT_FALSE(rights(AccessRights::kAdd).is_readable());
  ASSERT_TRUE(rights(AccessRights::kReadWrite).is_writeable());
  ASSERT_FALSE(rights(AccessRights::kReadAdd).is_writeable());
  ASSERT_TRUE(rights(AccessRights::kAddWrite).is_addable());
  ASSERT_FALSE(rights(AccessRights::kReadWrite).is_addable());
  ASSERT_EQ(rights(AccessRights::kReadAddWrite).name(), "READ_ADD_WRITE");
}

TEST(AccessRights, RejectsUnknownBits) {
  auto value = AccessRights::from_bits(0b1000);
  ASSERT_FALSE(value);
  ASSERT_EQ(value.error().code, ErrorCode::FormattingError);
}

TEST(URef, EncodingWithAndWithoutRights) {
  URef uref(filled(0x11), rights(AccessRights::kReadWrite));
  Bytes out;
  clw::bytesrepr::write_uref(out, uref);
  ASSERT_EQ(out.size(), 34u);
  ASSERT_EQ(out[32], 1);
  ASSERT_EQ(out[33], AccessRights::kReadWrite);

  Bytes bare;
  clw::bytesrepr::write_uref(bare, uref.remove_rights());
  ASSERT_EQ(bare.size(), 33u);
  ASSERT_EQ(bare[32], 0);

  Reader reader(out);
  ASSERT_EQ(clw::bytesrepr::read_uref(reader).value(), uref);
}

TEST(URef, DisplayString) {
  URef uref(filled(0xAB), rights(AccessRights::kRead));
  std::string hex;
  for (int i = 0; i < 32; ++i) {
    hex += "ab";
  }
  ASSERT_EQ(uref.to_string(), "uref-" + hex + "-READ");
}

TEST(Key, VariantByteLeadsEncoding) {
  Bytes out;
  clw::bytesrepr::write_key(out, Key::hash(filled(0x22)));
  ASSERT_EQ(out.size(), 33u);
  ASSERT_EQ(out[0], static_cast<std::uint8_t>(KeyKind::Hash));

  out.clear();
  clw::bytesrepr::write_key(out, Key::uref(URef(filled(0x33), rights(AccessRights::kAdd))));
  ASSERT_EQ(out.size(), 1u + 34u);
  ASSERT_EQ(out[0], static_cast<std::uint8_t>(KeyKind::URef));
}

TEST(Key, RoundTripEveryVariant) {
  const Key keys[] = {
      Key::account(filled(1)),
      Key::hash(filled(2)),
      Key::uref(URef(filled(3), std::nullopt)),
      Key::local(filled(4)),
  };
  for (const auto& key : keys) {
    Bytes out;
    clw::bytesrepr::write_key(out, key);
    Reader reader(out);
    auto decoded = clw::bytesrepr::read_key(reader);
    ASSERT_TRUE(decoded) << decoded.error().message;
    ASSERT_EQ(*decoded, key);
    ASSERT_TRUE(reader.finish());
  }
}

TEST(Key, UnknownVariantIsFormattingError) {
  Bytes out{9};
  Reader reader(out);
  auto key = clw::bytesrepr::read_key(reader);
  ASSERT_FALSE(key);
  ASSERT_EQ(key.error().code, ErrorCode::FormattingError);
}

TEST(Key, DisplayPrefixes) {
  ASSERT_TRUE(Key::account(filled(0)).to_string().starts_with("account-00"));
  ASSERT_TRUE(Key::hash(filled(0)).to_string().starts_with("hash-00"));
  ASSERT_TRUE(Key::local(filled(0)).to_string().starts_with("local-00"));
  ASSERT_TRUE(Key::uref(URef(filled(0), std::nullopt)).to_string().ends_with("-NONE"));
}
