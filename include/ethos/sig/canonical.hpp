#pragma once

#include "ethos/common/json.hpp"

#include <string>

namespace ethos::sig {

/// Deterministic byte encoding used as the input to hashing and signing:
/// keys sorted by UTF-8 byte order at every level, `,` and `:` separators,
/// raw UTF-8 strings, Python-repr layout for non-integral numbers.
[[nodiscard]] std::string canonical_json(const common::JsonValue &value);

} // namespace ethos::sig
