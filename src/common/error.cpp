#include "common/error.hpp"

namespace clw {

auto error_code_name(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::EarlyEndOfStream:
      return "early_end_of_stream";
    case ErrorCode::FormattingError:
      return "formatting_error";
    case ErrorCode::LeftOverBytes:
      return "left_over_bytes";
    case ErrorCode::UnknownTypeTag:
      return "unknown_type_tag";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

}  // namespace clw
