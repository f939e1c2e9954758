#include "hash.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace resource::util {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

void Update(EVP_MD_CTX* ctx, const void* data, size_t len) {
  if (len == 0) return;
  if (EVP_DigestUpdate(ctx, data, len) != 1) throw std::runtime_error("sha256 update failed");
}

void UpdateLengthPrefixed(EVP_MD_CTX* ctx, const std::string& value) {
  uint8_t len[8];
  uint64_t n = value.size();
  for (int i = 7; i >= 0; --i) {
    len[i] = static_cast<uint8_t>(n & 0xFF);
    n >>= 8;
  }
  Update(ctx, len, sizeof(len));
  Update(ctx, value.data(), value.size());
}

int Nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::string ContentHash(const std::map<std::string, std::string>& properties, const arrow::Buffer& payload) {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }

  UpdateLengthPrefixed(ctx.get(), std::to_string(properties.size()));
  for (const auto& [key, value] : properties) {
    UpdateLengthPrefixed(ctx.get(), key);
    UpdateLengthPrefixed(ctx.get(), value);
  }
  Update(ctx.get(), payload.data(), static_cast<size_t>(payload.size()));

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    throw std::runtime_error("sha256 final failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string FromHex(const std::string& hex) {
  if (hex.size() % 2 != 0) throw InvalidState("hex string has odd length");
  std::string out(hex.size() / 2, '\0');
  for (size_t i = 0; i < out.size(); ++i) {
    const int hi = Nibble(hex[2 * i]);
    const int lo = Nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) throw InvalidState("hex string contains non-hex character");
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

} // namespace resource::util
