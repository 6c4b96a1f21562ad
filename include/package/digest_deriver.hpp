#pragma once

#include "crypto/sha256.hpp"
#include "util/result.hpp"

#include <string>

namespace fwbundle {

inline constexpr const char kDigestFileName[] = "digest.bin";

enum class SigningKeyType {
    Rsa3072,
    EcdsaP192,
    EcdsaP256,
};

const char* SigningKeyTypeName(SigningKeyType type);

// Computes the Secure Boot V2 public key digest (SHA-256 over the public key
// blob the ROM checks against eFuse) from a PEM signing key.
//
// The key file is read into a buffer that is cleansed before Derive returns,
// whatever the outcome. Key bytes are never logged or written anywhere.
//
// Errors: KeyMissing when the file is absent or unreadable, KeyUnsupported
// when it is not PEM or not an RSA-3072 / ECDSA P-192 / P-256 key.
class DigestDeriver {
  public:
    Result Derive(const std::string& key_path, Sha256Digest& out, SigningKeyType* out_type = nullptr) const;
};

} // namespace fwbundle
