#pragma once

#include "ethos/common/json.hpp"

#include <string>
#include <string_view>

namespace ethos::sig {

/// SHA-256 of `bytes` as 64 lowercase hex characters.
[[nodiscard]] std::string sha256_hex(std::string_view bytes);

/// sha256_hex(canonical_json(value)).
[[nodiscard]] std::string hash_canonical(const common::JsonValue &value);

} // namespace ethos::sig
