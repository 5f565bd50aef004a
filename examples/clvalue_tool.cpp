#include <charconv>
#include <cstdint>
#include <format>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <gflags/gflags.h>

#include "bytesrepr/bytesrepr.hpp"
#include "bytesrepr/wide_uint.hpp"
#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "value/describe.hpp"
#include "value/tagged_value.hpp"

DEFINE_bool(encode, false, "Encode --value as --type and print the wire bytes as hex");
DEFINE_string(type, "string",
              "Value type for --encode (bool, i32, i64, u8, u32, u64, u128, u256, u512, unit, string, string_list)");
DEFINE_string(value, "", "Value for --encode; comma-separated for string_list");
DEFINE_string(decode, "", "Hex-encoded wire bytes to decode and describe");

namespace {

using clw::Expected;
using clw::value::TaggedValue;

template <typename Int>
auto parse_int(std::string_view text) -> Expected<Int> {
  Int value{};
  auto res = std::from_chars(text.data(), text.data() + text.size(), value);
  if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
    return tl::unexpected(clw::make_error(clw::ErrorCode::InvalidArgument,
                                          std::format("invalid integer '{}'", text)));
  }
  return value;
}

template <typename UInt>
auto parse_wide(std::string_view text) -> Expected<UInt> {
  auto value = clw::bytesrepr::parse_u512(text);
  if (!value) {
    return tl::unexpected(value.error());
  }
  if (*value > clw::bytesrepr::U512((std::numeric_limits<UInt>::max)())) {
    return tl::unexpected(clw::make_error(clw::ErrorCode::InvalidArgument,
                                          std::format("'{}' is out of range", text)));
  }
  return static_cast<UInt>(*value);
}

auto split(std::string_view text, char sep) -> std::vector<std::string> {
  std::vector<std::string> parts;
  if (text.empty()) {
    return parts;
  }
  std::size_t start = 0;
  while (true) {
    auto pos = text.find(sep, start);
    parts.emplace_back(text.substr(start, pos - start));
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return parts;
}

template <typename T, typename Fn>
auto build(Expected<T> parsed, Fn fn) -> Expected<TaggedValue> {
  if (!parsed) {
    return tl::unexpected(parsed.error());
  }
  return fn(*parsed);
}

auto make_value(std::string_view type, std::string_view text) -> Expected<TaggedValue> {
  if (type == "bool") {
    if (text == "true") return TaggedValue::from_bool(true);
    if (text == "false") return TaggedValue::from_bool(false);
    return tl::unexpected(clw::make_error(clw::ErrorCode::InvalidArgument,
                                          std::format("invalid bool '{}'", text)));
  }
  if (type == "i32") return build(parse_int<std::int32_t>(text), &TaggedValue::from_i32);
  if (type == "i64") return build(parse_int<std::int64_t>(text), &TaggedValue::from_i64);
  if (type == "u8") return build(parse_int<std::uint8_t>(text), &TaggedValue::from_u8);
  if (type == "u32") return build(parse_int<std::uint32_t>(text), &TaggedValue::from_u32);
  if (type == "u64") return build(parse_int<std::uint64_t>(text), &TaggedValue::from_u64);
  if (type == "u128") {
    return build(parse_wide<clw::bytesrepr::U128>(text), &TaggedValue::from_u128);
  }
  if (type == "u256") {
    return build(parse_wide<clw::bytesrepr::U256>(text), &TaggedValue::from_u256);
  }
  if (type == "u512") return build(clw::bytesrepr::parse_u512(text), &TaggedValue::from_u512);
  if (type == "unit") return TaggedValue::from_unit();
  if (type == "string") return TaggedValue::from_string(text);
  if (type == "string_list") {
    auto items = split(text, ',');
    return TaggedValue::from_string_list(items);
  }
  return tl::unexpected(clw::make_error(clw::ErrorCode::InvalidArgument,
                                        std::format("unsupported type '{}'", type)));
}

auto run_encode() -> int {
  auto value = make_value(FLAGS_type, FLAGS_value);
  if (!value) {
    clw::log::error("encode failed: {}", value.error().message);
    std::cerr << value.error().message << "\n";
    return 1;
  }
  auto wire = value->to_wire();
  clw::log::info("encoded", {{"type", value->type().to_string()},
                             {"wire_size", std::to_string(wire.size())}});
  std::cout << clw::bytesrepr::to_hex(wire) << "\n";
  return 0;
}

auto run_decode() -> int {
  auto wire = clw::bytesrepr::from_hex(FLAGS_decode);
  if (!wire) {
    clw::log::error("decode failed: {}", wire.error().message);
    std::cerr << wire.error().message << "\n";
    return 1;
  }
  auto value = TaggedValue::from_wire(*wire);
  if (!value) {
    clw::log::error("decode failed: {} ({})", value.error().message,
                    clw::error_code_name(value.error().code));
    std::cerr << value.error().message << "\n";
    return 1;
  }
  auto json = clw::value::describe(*value);
  if (!json) {
    clw::log::error("describe failed: {} ({})", json.error().message,
                    clw::error_code_name(json.error().code));
    std::cerr << json.error().message << "\n";
    return 1;
  }
  clw::value::Json out{
      {"type", value->type().to_string()},
      {"fingerprint", clw::value::to_string(value->type().fingerprint())},
      {"payload_size", value->payload().size()},
      {"value", std::move(*json)},
  };
  clw::log::info("decoded", {{"type", value->type().to_string()},
                             {"payload_size", std::to_string(value->payload().size())},
                             {"wire_size", std::to_string(wire->size())}});
  std::cout << out.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("clvalue_tool --encode --type=<type> --value=<value> | --decode=<hex>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  clw::log::init();

  int rc = 1;
  if (FLAGS_encode) {
    rc = run_encode();
  } else if (!FLAGS_decode.empty()) {
    rc = run_decode();
  } else {
    std::cerr << gflags::ProgramUsage() << "\n";
  }

  clw::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return rc;
}
