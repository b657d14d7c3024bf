#include "hash.hpp"

#include <openssl/evp.h>

#include "internal/util/errors.hpp"

namespace modelplan::util {

void Sha256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw DigestError("sha256: failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw DigestError("sha256: digest init failed");
  }
}

Sha256::~Sha256() = default;

void Sha256::Update(std::string_view data) {
  if (finalized_) {
    throw InvalidState("sha256: update after digest");
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw DigestError("sha256: digest update failed");
  }
}

std::string Sha256::HexDigest() {
  if (finalized_) {
    throw InvalidState("sha256: digest already taken");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    throw DigestError("sha256: digest final failed");
  }
  finalized_ = true;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    result.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    result.push_back(kHex[digest[i] & 0x0F]);
  }
  return result;
}

std::string Sha256Hex(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.HexDigest();
}

} // namespace modelplan::util
