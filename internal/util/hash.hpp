#pragma once

#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace modelplan::util {

/*
  Incremental SHA-256 (OpenSSL EVP).

  Plan and step identifiers are content hashes so they can double as
  idempotency keys; a fast non-cryptographic hash is not acceptable here.
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  // Throws util::InvalidState once the digest has been taken.
  void Update(std::string_view data);

  // Lower-case hex digest. The hasher cannot be updated afterwards.
  std::string HexDigest();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const;
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool                                    finalized_ = false;
};

std::string Sha256Hex(std::string_view data);

} // namespace modelplan::util
