#include "value/cl_type.hpp"
#include "value/type_tag.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using clw::ErrorCode;
using clw::bytesrepr::Bytes;
using clw::value::CLType;
using clw::value::TypeTag;

TEST(TypeTag, PinnedWireValues) {
  ASSERT_EQ(clw::value::to_byte(TypeTag::Bool), 0);
  ASSERT_EQ(clw::value::to_byte(TypeTag::I32), 1);
  ASSERT_EQ(clw::value::to_byte(TypeTag::I64), 2);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U8), 3);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U32), 4);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U64), 5);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U128), 6);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U256), 7);
  ASSERT_EQ(clw::value::to_byte(TypeTag::U512), 8);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Unit), 9);
  ASSERT_EQ(clw::value::to_byte(TypeTag::String), 10);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Key), 11);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Uref), 12);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Option), 13);
  ASSERT_EQ(clw::value::to_byte(TypeTag::List), 14);
  ASSERT_EQ(clw::value::to_byte(TypeTag::FixedList), 15);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Result), 16);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Map), 17);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Tuple1), 18);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Tuple2), 19);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Tuple3), 20);
  ASSERT_EQ(clw::value::to_byte(TypeTag::Any), 21);
}

TEST(TypeTag, FromByte) {
  for (int byte = 0; byte <= 21; ++byte) {
    auto tag = clw::value::tag_from_byte(static_cast<std::uint8_t>(byte));
    ASSERT_TRUE(tag);
    ASSERT_EQ(clw::value::to_byte(*tag), byte);
  }
  auto unknown = clw::value::tag_from_byte(22);
  ASSERT_FALSE(unknown);
  ASSERT_EQ(unknown.error().code, ErrorCode::UnknownTypeTag);
}

TEST(TypeTag, Arity) {
  ASSERT_EQ(clw::value::child_count(TypeTag::U512), 0u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Any), 0u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Option), 1u);
  ASSERT_EQ(clw::value::child_count(TypeTag::FixedList), 1u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Tuple1), 1u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Result), 2u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Map), 2u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Tuple2), 2u);
  ASSERT_EQ(clw::value::child_count(TypeTag::Tuple3), 3u);
}

TEST(CLType, LeafRejectsConstructorTag) {
  ASSERT_THROW(CLType(TypeTag::List), std::invalid_argument);
  ASSERT_NO_THROW(CLType(TypeTag::Any));
}

TEST(CLType, FlattensOutermostFirst) {
  ASSERT_EQ(CLType::list(CLType::string()).to_bytes(), (Bytes{14, 10}));
  ASSERT_EQ(CLType::option(CLType::u512()).to_bytes(), (Bytes{13, 8}));
  auto nested = CLType::map(CLType::string(), CLType::list(CLType::option(CLType::key())));
  ASSERT_EQ(nested.to_bytes(), (Bytes{17, 10, 14, 13, 11}));
  auto tuple = CLType::tuple3(CLType::u8(), CLType::result(CLType::unit(), CLType::string()),
                              CLType::bool_());
  ASSERT_EQ(tuple.to_bytes(), (Bytes{20, 3, 16, 9, 10, 0}));
}

TEST(CLType, ParseRebuildsTree) {
  auto type = CLType::tuple2(CLType::list(CLType::list(CLType::u8())), CLType::uref());
  auto parsed = CLType::parse(type.to_bytes());
  ASSERT_TRUE(parsed) << parsed.error().message;
  ASSERT_EQ(*parsed, type);
  ASSERT_EQ(parsed->to_string(), "Tuple2<List<List<U8>>, URef>");
}

TEST(CLType, ParseErrors) {
  auto missing_child = CLType::parse(Bytes{17, 10});
  ASSERT_FALSE(missing_child);
  ASSERT_EQ(missing_child.error().code, ErrorCode::EarlyEndOfStream);

  auto unknown = CLType::parse(Bytes{14, 99});
  ASSERT_FALSE(unknown);
  ASSERT_EQ(unknown.error().code, ErrorCode::UnknownTypeTag);

  auto trailing = CLType::parse(Bytes{10, 10});
  ASSERT_FALSE(trailing);
  ASSERT_EQ(trailing.error().code, ErrorCode::LeftOverBytes);

  auto empty = CLType::parse(Bytes{});
  ASSERT_FALSE(empty);
  ASSERT_EQ(empty.error().code, ErrorCode::EarlyEndOfStream);
}

TEST(CLType, ParseBoundsNesting) {
  Bytes deep(1000, clw::value::to_byte(TypeTag::Option));
  deep.push_back(clw::value::to_byte(TypeTag::Unit));
  auto parsed = CLType::parse(deep);
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, ErrorCode::FormattingError);
}

TEST(CLType, FingerprintIsStablePerPath) {
  auto a = CLType::list(CLType::string());
  auto b = CLType::list(CLType::string());
  auto c = CLType::list(CLType::key());
  ASSERT_EQ(a.fingerprint(), b.fingerprint());
  ASSERT_NE(a.fingerprint(), c.fingerprint());
  ASSERT_EQ(clw::value::to_string(a.fingerprint()).size(), 32u);
}
