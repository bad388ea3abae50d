#include "digest.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

namespace codegraph::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

std::string ToHex(const unsigned char* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string Md5HexPrefix(std::string_view input, std::size_t prefix_bytes) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize MD5");
  }
  if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("Failed to update MD5");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int                               hash_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize MD5");
  }

  return ToHex(hash.data(), std::min<std::size_t>(prefix_bytes, hash_len));
}

} // namespace codegraph::util
