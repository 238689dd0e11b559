#include "ethos/common/encoding.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace ethos::common {

namespace {

bool is_base64_char(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' ||
         c == '/';
}

} // namespace

std::string base64_encode(const Bytes &bytes) {
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  // EVP_EncodeBlock writes a trailing NUL.
  std::string output(static_cast<std::size_t>(output_len) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                                      bytes.data(), static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

Result<Bytes> base64_decode(const std::string_view text) {
  if (text.empty()) {
    return Result<Bytes>::success({});
  }
  if (text.size() % 4 != 0) {
    return Result<Bytes>::failure("invalid base64 input: length is not a multiple of 4");
  }

  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text[text.size() - 2] == '=') {
    ++padding;
  }
  for (std::size_t i = 0; i < text.size() - padding; ++i) {
    if (!is_base64_char(text[i])) {
      return Result<Bytes>::failure("invalid base64 input");
    }
  }

  Bytes decoded(text.size());
  const int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return Result<Bytes>::failure("invalid base64 input");
  }

  decoded.resize(static_cast<std::size_t>(len) - padding);
  return Result<Bytes>::success(std::move(decoded));
}

std::string hex_encode(const unsigned char *data, const std::size_t size) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    out << std::setw(2) << static_cast<int>(data[i]);
  }
  return out.str();
}

bool is_lower_hex(const std::string_view text, const std::size_t expected_size) {
  if (text.size() != expected_size) {
    return false;
  }
  for (const char c : text) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace ethos::common
