#pragma once

#include <nlohmann/json.hpp>

#include "bytesrepr/bytesrepr.hpp"
#include "common/error.hpp"
#include "value/cl_type.hpp"
#include "value/tagged_value.hpp"

namespace clw::value {

using Json = nlohmann::json;

/// Decode a payload guided only by its type path and render it as JSON.
auto describe(const TaggedValue& value) -> Expected<Json>;

/// Decode one value of `type` from the reader.
auto describe_next(const CLType& type, bytesrepr::Reader& reader) -> Expected<Json>;

} // namespace clw::value
