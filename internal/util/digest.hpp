#pragma once

#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace dockyard::util {

/*
  Incremental SHA-256 (OpenSSL EVP).

  UpdateField() length-prefixes its input so that a sequence of fields
  hashes unambiguously ("ab","c" != "a","bc").
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  Sha256& Update(std::string_view data);
  Sha256& UpdateField(std::string_view field);

  // "sha256:<hex>"; the hasher cannot be updated afterwards.
  std::string Finish();

 private:
  EVP_MD_CTX* ctx_      = nullptr;
  bool        finished_ = false;
};

std::string Sha256Digest(std::string_view data);

} // namespace dockyard::util
