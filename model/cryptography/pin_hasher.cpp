/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/pin_hasher.hpp"

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include "common/hexutils.hpp"

namespace {
  std::string lastOpensslError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
  }
}  // namespace

namespace teller {
  namespace crypto {

    expected::Result<model::types::PinHashType, std::string> PinHasher::hash(
        std::string_view pin) const {
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
          EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (not ctx) {
        return expected::makeError(std::string{"Cannot allocate digest."});
      }

      unsigned char digest[EVP_MAX_MD_SIZE];
      unsigned int digest_size = 0;
      if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
          or EVP_DigestUpdate(ctx.get(), pin.data(), pin.size()) != 1
          or EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
        return expected::makeError("SHA-256 failed: " + lastOpensslError());
      }
      return expected::makeValue(bytesToHexstring(digest, digest + digest_size));
    }

  }  // namespace crypto
}  // namespace teller
