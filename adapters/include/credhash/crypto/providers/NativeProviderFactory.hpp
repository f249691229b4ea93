#ifndef INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "credhash/crypto/IHashProvider.hpp"
#include <memory>

namespace credhash::crypto::providers
{

// Monocypher-backed. Only the SHA-512 entries (PBKDF2WithHmacSHA512, SHA-512).
[[nodiscard]] std::unique_ptr<credhash::crypto::IHashProvider> makeNativeHashProvider();

} // namespace credhash::crypto::providers

#endif // INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
