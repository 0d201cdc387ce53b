#include "facefind_core/util/digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace facefind_core {

std::string sha256_hex(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to allocate digest context");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 computation failed");
  }

  std::ostringstream hex;
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  }
  return hex.str();
}

std::string base64_encode(const std::vector<unsigned char>& data) {
  if (data.empty()) {
    return {};
  }
  // 4 output chars per 3 input bytes plus the terminating NUL
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                static_cast<int>(data.size()));
  if (written < 0) {
    throw std::runtime_error("Base64 encoding failed");
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

}  // namespace facefind_core
