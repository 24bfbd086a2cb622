#include "digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <stdexcept>

namespace dockyard::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::string HexEncode(const unsigned char* data, unsigned int size) {
  std::string result;
  result.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

} // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() {
  if (ctx_) EVP_MD_CTX_free(ctx_);
}

Sha256& Sha256::Update(std::string_view data) {
  if (finished_) throw std::logic_error("sha256: update after finish");
  if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

Sha256& Sha256::UpdateField(std::string_view field) {
  const auto                size = static_cast<uint64_t>(field.size());
  std::array<char, 8>       prefix{};
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    prefix[i] = static_cast<char>((size >> (8 * i)) & 0xFF);
  }
  Update(std::string_view(prefix.data(), prefix.size()));
  return Update(field);
}

std::string Sha256::Finish() {
  if (finished_) throw std::logic_error("sha256: finish called twice");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finished_ = true;
  return "sha256:" + HexEncode(digest, length);
}

std::string Sha256Digest(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.Finish();
}

} // namespace dockyard::util
