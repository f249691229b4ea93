#ifndef INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "credhash/crypto/IHashProvider.hpp"
#include <memory>

namespace credhash::crypto::providers
{

// Supports every registry entry.
[[nodiscard]] std::unique_ptr<credhash::crypto::IHashProvider> makeOpenSslHashProvider();

} // namespace credhash::crypto::providers

#endif // INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
