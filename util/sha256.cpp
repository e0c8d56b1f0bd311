#include "util/sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace util {

std::string SHA256_t::Hex() const {
  static const constexpr char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(2 * size());
  for (uint8_t byte : *this) {
    out += kDigits[byte >> 4];
    out += kDigits[byte & 0xf];
  }
  return out;
}

SHA256_t HashString(absl::string_view data) {
  SHA256_t digest;
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(),
                 nullptr) != 1 ||
      len != digest.size()) {
    throw std::runtime_error("EVP_Digest failed");
  }
  return digest;
}

}  // namespace util
