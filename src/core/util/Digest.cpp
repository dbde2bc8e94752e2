#include "Digest.hpp"

#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace rsb {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return to_hex(hash, hashLen);
}

std::string short_digest(std::string_view bytes, size_t width) {
  std::string full = sha256_hex(bytes);
  if (width < full.size()) full.resize(width);
  return full;
}

} // namespace rsb
