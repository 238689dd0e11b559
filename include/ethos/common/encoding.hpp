#pragma once

#include "ethos/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ethos::common {

using Bytes = std::vector<unsigned char>;

/// Standard base64 with `=` padding.
[[nodiscard]] std::string base64_encode(const Bytes &bytes);
/// Rejects characters outside the standard alphabet, bad padding and lengths
/// that are not a multiple of four.
[[nodiscard]] Result<Bytes> base64_decode(std::string_view text);

[[nodiscard]] std::string hex_encode(const unsigned char *data, std::size_t size);
[[nodiscard]] bool is_lower_hex(std::string_view text, std::size_t expected_size);

} // namespace ethos::common
