//! # Digests
//!
//! SHA-1 fingerprints of source text, computed through OpenSSL's EVP API.
//! Used for provider source hashes, emission identities and the
//! coordinator's content cache.

#ifndef SFG_CRYPTO_DIGEST_HPP
#define SFG_CRYPTO_DIGEST_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace sfg::crypto {

struct DigestError {
    std::string message;
};

/// Lowercase hex SHA-1 of `data` (40 characters).
[[nodiscard]] auto sha1_hex(std::string_view data) -> Result<std::string, DigestError>;

} // namespace sfg::crypto

#endif // SFG_CRYPTO_DIGEST_HPP
