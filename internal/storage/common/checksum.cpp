#include "checksum.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"

namespace optiraid::storage::common {

namespace {

constexpr std::int64_t kReadChunk = 1 << 20;

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext NewSha256() {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("sha256 update failed");
  }
}

std::string FinishHex(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw std::runtime_error("sha256 final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    result.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    result.push_back(kHex[digest[i] & 0x0F]);
  }
  return result;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256();
  Update(ctx.get(), data.data(), data.size());
  return FinishHex(ctx.get());
}

std::string Sha256HexOfFile(const std::filesystem::path& path) {
  auto ctx = NewSha256();
  ForEachChunk(path.string(), kReadChunk, [&](const std::uint8_t* data, std::size_t size) { Update(ctx.get(), data, size); });
  return FinishHex(ctx.get());
}

} // namespace optiraid::storage::common
