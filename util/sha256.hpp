#ifndef UTIL_SHA256_H
#define UTIL_SHA256_H

#include <array>
#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"

namespace util {

const constexpr uint32_t kSHA256DigestSize = 256 / 8;

class SHA256_t : public std::array<uint8_t, kSHA256DigestSize> {
 public:
  std::string Hex() const;

  bool isZero() const {
    for (const auto block : *this)
      if (block != 0) return false;
    return true;
  }
};

// Hash of an in-memory buffer.
SHA256_t HashString(absl::string_view data);

}  // namespace util
#endif
