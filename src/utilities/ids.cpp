#include "utilities/ids.h"

#include <cppcodec/base64_url_unpadded.hpp>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace xferpress {

static void ensureSodium() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

std::string randomHex(std::size_t bytes) {
  ensureSodium();
  std::vector<unsigned char> buf(bytes);
  randombytes_buf(buf.data(), buf.size());
  std::string hex(bytes * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), buf.data(), buf.size());
  hex.pop_back();
  return hex;
}

std::string randomUrlId(std::size_t bytes) {
  ensureSodium();
  std::vector<unsigned char> buf(bytes);
  randombytes_buf(buf.data(), buf.size());
  return cppcodec::base64_url_unpadded::encode(buf);
}

std::string hexEncode(const std::string &text) {
  std::string hex(text.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(),
                 reinterpret_cast<const unsigned char *>(text.data()),
                 text.size());
  hex.pop_back();
  return hex;
}

} // namespace xferpress
