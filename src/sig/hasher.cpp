#include "ethos/sig/hasher.hpp"

#include "ethos/common/encoding.hpp"
#include "ethos/sig/canonical.hpp"

#include <openssl/sha.h>

namespace ethos::sig {

std::string sha256_hex(const std::string_view bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest);
  return common::hex_encode(digest, sizeof(digest));
}

std::string hash_canonical(const common::JsonValue &value) {
  return sha256_hex(canonical_json(value));
}

} // namespace ethos::sig
