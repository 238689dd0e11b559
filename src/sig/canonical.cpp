#include "ethos/sig/canonical.hpp"

namespace ethos::sig {

// JsonObject is a std::map, and char_traits<char> compares as unsigned char,
// so the compact writer already emits keys in UTF-8 byte order.
std::string canonical_json(const common::JsonValue &value) { return common::dump_json(value); }

} // namespace ethos::sig
