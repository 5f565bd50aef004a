#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace clw {

enum class ErrorCode : std::uint8_t {
  EarlyEndOfStream,
  FormattingError,
  LeftOverBytes,
  UnknownTypeTag,
  Unsupported,
  InvalidArgument,
};

auto error_code_name(ErrorCode code) -> std::string_view;

struct Error {
  ErrorCode code = ErrorCode::FormattingError;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
  return Error{code, std::move(message)};
}

}  // namespace clw
