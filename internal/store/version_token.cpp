#include "version_token.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace airspace::store {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

std::array<unsigned char, 32> Sha256(std::string_view a, std::string_view b) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

  std::array<unsigned char, 32> out{};
  unsigned int                  out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), a.data(), a.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), b.data(), b.size()) != 1 || EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("OpenSSL: sha256 failed");
  }
  return out;
}

} // namespace

std::string VersionToken::Encode(util::TimePoint updated_at, std::string_view id) {
  const auto digest = Sha256(id, util::FormatRfc3339(updated_at));

  // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
  std::array<unsigned char, ((32 + 2) / 3) * 4 + 1> b64{};
  const int n = EVP_EncodeBlock(b64.data(), digest.data(), static_cast<int>(digest.size()));

  std::string token(reinterpret_cast<const char*>(b64.data()), static_cast<std::size_t>(n));
  while (!token.empty() && token.back() == '=') token.pop_back();
  return token;
}

bool VersionToken::Validate(std::string_view token, util::TimePoint updated_at, std::string_view id) {
  const std::string expected = Encode(updated_at, id);
  if (token.size() != expected.size()) return false;
  return CRYPTO_memcmp(token.data(), expected.data(), expected.size()) == 0;
}

} // namespace airspace::store
