#include "value/describe.hpp"

#include <format>
#include <utility>

#include "bytesrepr/key.hpp"
#include "bytesrepr/uref.hpp"
#include "bytesrepr/wide_uint.hpp"
#include "common/logging/log.hpp"

namespace clw::value {
namespace {

template <typename T, typename Fn>
auto render(Expected<T> decoded, Fn&& fn) -> Expected<Json> {
  if (!decoded) {
    return tl::unexpected(decoded.error());
  }
  return std::forward<Fn>(fn)(std::move(*decoded));
}

constexpr auto as_json = [](auto v) -> Json { return Json(std::move(v)); };
constexpr auto as_decimal = [](const auto& v) -> Json { return Json(bytesrepr::to_decimal(v)); };

// Zero-width elements consume no input, so their total per decode is capped.
constexpr std::size_t kMaxZeroWidthElements = std::size_t{1} << 16;

struct ElementBudget {
  std::size_t zero_width_left = kMaxZeroWidthElements;
};

auto describe_value(const CLType& type, bytesrepr::Reader& reader, ElementBudget& budget)
    -> Expected<Json>;

/// Fewest payload bytes any value of `type` can occupy.
auto min_encoded_width(const CLType& type) -> std::size_t {
  switch (type.tag()) {
    case TypeTag::Bool:
    case TypeTag::U8:
    case TypeTag::U128:
    case TypeTag::U256:
    case TypeTag::U512:
    case TypeTag::Option:
    case TypeTag::Result:
      return 1;
    case TypeTag::I32:
    case TypeTag::U32:
    case TypeTag::String:
    case TypeTag::List:
    case TypeTag::Map:
      return 4;
    case TypeTag::I64:
    case TypeTag::U64:
      return 8;
    case TypeTag::Key:
    case TypeTag::Uref:
      return bytesrepr::kAddressLength + 1;
    case TypeTag::Tuple1:
    case TypeTag::Tuple2:
    case TypeTag::Tuple3: {
      std::size_t width = 0;
      for (const auto& child : type.children()) {
        width += min_encoded_width(child);
      }
      return width;
    }
    case TypeTag::Unit:
    case TypeTag::FixedList:
    case TypeTag::Any:
      return 0;
  }
  return 0;
}

/// Read a u32 element count and reject counts the remaining input cannot hold.
auto read_count(bytesrepr::Reader& reader, std::size_t element_width, ElementBudget& budget)
    -> Expected<std::uint32_t> {
  auto count = reader.read_u32();
  if (!count) {
    return count;
  }
  if (element_width == 0) {
    if (*count > budget.zero_width_left) {
      return tl::unexpected(make_error(
          ErrorCode::FormattingError,
          std::format("{} zero-width elements exceed limit {}", *count, kMaxZeroWidthElements)));
    }
    budget.zero_width_left -= *count;
  } else if (*count > reader.remaining() / element_width) {
    return tl::unexpected(make_error(
        ErrorCode::EarlyEndOfStream,
        std::format("{} elements of at least {} bytes, {} remaining", *count, element_width,
                    reader.remaining())));
  }
  return count;
}

auto describe_sequence(const CLType& element, std::uint32_t count, bytesrepr::Reader& reader,
                       ElementBudget& budget) -> Expected<Json> {
  auto items = Json::array();
  for (std::uint32_t i = 0; i < count; ++i) {
    auto item = describe_value(element, reader, budget);
    if (!item) {
      return item;
    }
    items.push_back(std::move(*item));
  }
  return items;
}

auto describe_flag(const CLType& type, bytesrepr::Reader& reader, ElementBudget& budget)
    -> Expected<Json> {
  auto flag = reader.read_u8();
  if (!flag) {
    return tl::unexpected(flag.error());
  }
  if (type.tag() == TypeTag::Option) {
    if (*flag == bytesrepr::kOptionNone) {
      return Json(nullptr);
    }
    if (*flag == bytesrepr::kOptionSome) {
      return describe_value(type.child(0), reader, budget);
    }
  } else {
    if (*flag == bytesrepr::kResultOk || *flag == bytesrepr::kResultErr) {
      const bool ok = *flag == bytesrepr::kResultOk;
      auto inner = describe_value(type.child(ok ? 0 : 1), reader, budget);
      if (!inner) {
        return inner;
      }
      return Json{{ok ? "ok" : "err", std::move(*inner)}};
    }
  }
  return tl::unexpected(make_error(
      ErrorCode::FormattingError,
      std::format("invalid {} discriminant {:#04x}", tag_name(type.tag()), *flag)));
}

auto describe_value(const CLType& type, bytesrepr::Reader& reader, ElementBudget& budget)
    -> Expected<Json> {
  if (type.children().size() != child_count(type.tag())) {
    return tl::unexpected(make_error(
        ErrorCode::Unsupported,
        std::format("{} names no element type", tag_name(type.tag()))));
  }
  switch (type.tag()) {
    case TypeTag::Bool:
      return render(reader.read_bool(), as_json);
    case TypeTag::I32:
      return render(reader.read_i32(), as_json);
    case TypeTag::I64:
      return render(reader.read_i64(), as_json);
    case TypeTag::U8:
      return render(reader.read_u8(), as_json);
    case TypeTag::U32:
      return render(reader.read_u32(), as_json);
    case TypeTag::U64:
      return render(reader.read_u64(), as_json);
    case TypeTag::U128:
      return render(bytesrepr::read_u128(reader), as_decimal);
    case TypeTag::U256:
      return render(bytesrepr::read_u256(reader), as_decimal);
    case TypeTag::U512:
      return render(bytesrepr::read_u512(reader), as_decimal);
    case TypeTag::Unit:
      return Json(nullptr);
    case TypeTag::String:
      return render(reader.read_string(), as_json);
    case TypeTag::Key:
      return render(bytesrepr::read_key(reader),
                    [](const bytesrepr::Key& key) { return Json(key.to_string()); });
    case TypeTag::Uref:
      return render(bytesrepr::read_uref(reader),
                    [](const bytesrepr::URef& uref) { return Json(uref.to_string()); });
    case TypeTag::Option:
    case TypeTag::Result:
      return describe_flag(type, reader, budget);
    case TypeTag::List: {
      auto count = read_count(reader, min_encoded_width(type.child(0)), budget);
      if (!count) {
        return tl::unexpected(count.error());
      }
      return describe_sequence(type.child(0), *count, reader, budget);
    }
    case TypeTag::Map: {
      auto count = read_count(reader, min_encoded_width(type.child(0)) +
                                          min_encoded_width(type.child(1)),
                            budget);
      if (!count) {
        return tl::unexpected(count.error());
      }
      auto entries = Json::array();
      for (std::uint32_t i = 0; i < *count; ++i) {
        auto key = describe_value(type.child(0), reader, budget);
        if (!key) {
          return key;
        }
        auto value = describe_value(type.child(1), reader, budget);
        if (!value) {
          return value;
        }
        entries.push_back(Json{{"key", std::move(*key)}, {"value", std::move(*value)}});
      }
      return entries;
    }
    case TypeTag::Tuple1:
    case TypeTag::Tuple2:
    case TypeTag::Tuple3: {
      auto items = Json::array();
      for (const auto& child : type.children()) {
        auto item = describe_value(child, reader, budget);
        if (!item) {
          return item;
        }
        items.push_back(std::move(*item));
      }
      return items;
    }
    case TypeTag::FixedList:
    case TypeTag::Any:
      break;
  }
  return tl::unexpected(make_error(
      ErrorCode::Unsupported,
      std::format("{} values carry no decodable layout", tag_name(type.tag()))));
}

} // namespace

auto describe_next(const CLType& type, bytesrepr::Reader& reader) -> Expected<Json> {
  ElementBudget budget;
  return describe_value(type, reader, budget);
}

auto describe(const TaggedValue& value) -> Expected<Json> {
  bytesrepr::Reader reader(value.payload());
  auto json = describe_next(value.type(), reader);
  if (!json) {
    log::debug("cannot describe {} value: {}", value.type().to_string(), json.error().message);
    return json;
  }
  if (auto done = reader.finish(); !done) {
    return tl::unexpected(done.error());
  }
  return json;
}

} // namespace clw::value
