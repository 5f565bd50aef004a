#include "value/cl_type.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace clw::value {
namespace {

// Bounds recursion on hostile input; legitimate paths are a few levels deep.
constexpr std::size_t kMaxDepth = 64;

} // namespace

CLType::CLType(TypeTag tag) : tag_(tag) {
  if (is_constructor(tag)) {
    throw std::invalid_argument(
        std::format("type constructor {} needs nested types", tag_name(tag)));
  }
}

CLType::CLType(TypeTag tag, std::vector<CLType> children)
    : tag_(tag), children_(std::move(children)) {}

auto CLType::option(CLType inner) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(inner));
  return CLType(TypeTag::Option, std::move(children));
}

auto CLType::list(CLType element) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(element));
  return CLType(TypeTag::List, std::move(children));
}

auto CLType::fixed_list(CLType element) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(element));
  return CLType(TypeTag::FixedList, std::move(children));
}

auto CLType::result(CLType ok, CLType err) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(ok));
  children.push_back(std::move(err));
  return CLType(TypeTag::Result, std::move(children));
}

auto CLType::map(CLType key, CLType value) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(key));
  children.push_back(std::move(value));
  return CLType(TypeTag::Map, std::move(children));
}

auto CLType::tuple1(CLType first) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(first));
  return CLType(TypeTag::Tuple1, std::move(children));
}

auto CLType::tuple2(CLType first, CLType second) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(first));
  children.push_back(std::move(second));
  return CLType(TypeTag::Tuple2, std::move(children));
}

auto CLType::tuple3(CLType first, CLType second, CLType third) -> CLType {
  std::vector<CLType> children;
  children.push_back(std::move(first));
  children.push_back(std::move(second));
  children.push_back(std::move(third));
  return CLType(TypeTag::Tuple3, std::move(children));
}

auto CLType::parse(std::span<const std::uint8_t> bytes) -> Expected<CLType> {
  bytesrepr::Reader reader(bytes);
  auto type = read(reader);
  if (!type) {
    return type;
  }
  if (auto done = reader.finish(); !done) {
    return tl::unexpected(done.error());
  }
  return type;
}

auto CLType::read(bytesrepr::Reader& reader) -> Expected<CLType> {
  return read_at_depth(reader, 0);
}

auto CLType::read_at_depth(bytesrepr::Reader& reader, std::size_t depth) -> Expected<CLType> {
  if (depth > kMaxDepth) {
    return tl::unexpected(make_error(ErrorCode::FormattingError,
                                     std::format("type path nested deeper than {}", kMaxDepth)));
  }
  auto byte = reader.read_u8();
  if (!byte) {
    return tl::unexpected(byte.error());
  }
  auto tag = tag_from_byte(*byte);
  if (!tag) {
    return tl::unexpected(tag.error());
  }
  std::vector<CLType> children;
  children.reserve(child_count(*tag));
  for (std::size_t i = 0; i < child_count(*tag); ++i) {
    auto child = read_at_depth(reader, depth + 1);
    if (!child) {
      return tl::unexpected(child.error());
    }
    children.push_back(std::move(*child));
  }
  return CLType(*tag, std::move(children));
}

auto CLType::to_bytes() const -> bytesrepr::Bytes {
  bytesrepr::Bytes out;
  append_bytes(out);
  return out;
}

auto CLType::append_bytes(bytesrepr::Bytes& out) const -> void {
  out.push_back(to_byte(tag_));
  for (const auto& child : children_) {
    child.append_bytes(out);
  }
}

auto CLType::to_string() const -> std::string {
  std::string text{tag_name(tag_)};
  if (children_.empty()) {
    return text;
  }
  text += '<';
  for (std::size_t i = 0; i < children_.size(); ++i) {
    if (i != 0) {
      text += ", ";
    }
    text += children_[i].to_string();
  }
  text += '>';
  return text;
}

auto CLType::fingerprint() const -> TypeDigest {
  return hash_type_bytes(to_bytes());
}

} // namespace clw::value
