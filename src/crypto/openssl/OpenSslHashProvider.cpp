#include "credhash/core/CredentialErrors.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace credhash::crypto::providers
{
namespace
{

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpKdfPtr fetchPbkdf2Kdf()
{
    if (EVP_KDF * kdf{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr) }; kdf != nullptr)
    {
        return EvpKdfPtr{ kdf, &EVP_KDF_free };
    }
    return EvpKdfPtr{ nullptr, &EVP_KDF_free };
}

// Null when the loaded providers do not offer the digest (e.g. MD5 under a FIPS-only config).
EvpMdPtr fetchDigest(std::string_view name)
{
    const std::string nameCopy{ name };
    return EvpMdPtr{ EVP_MD_fetch(nullptr, nameCopy.c_str(), nullptr), &EVP_MD_free };
}

[[noreturn]] void throwUnsupported(const char* operation, std::string_view algorithmName)
{
    std::string message{ operation };
    message += ": algorithm not available in OpenSSL: ";
    message += algorithmName;
    throw credhash::core::CredentialError(credhash::core::CredentialErrc::UnsupportedAlgorithm, message);
}

class OpenSslHashProvider final : public credhash::crypto::IHashProvider
{
public:
    OpenSslHashProvider() : m_pbkdf2{ fetchPbkdf2Kdf() }
    {
        for (const auto& info : credhash::crypto::passwordAlgorithms())
        {
            m_passwordDigests.push_back(fetchDigest(info.digestName));
        }
        for (const auto& info : credhash::crypto::keyAlgorithms())
        {
            m_keyDigests.push_back(fetchDigest(info.digestName));
        }
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "openssl";
    }

    [[nodiscard]] bool supports(credhash::crypto::PasswordAlgorithm algorithm) const noexcept override
    {
        return m_pbkdf2 != nullptr && passwordDigest(algorithm) != nullptr;
    }

    [[nodiscard]] bool supports(credhash::crypto::KeyAlgorithm algorithm) const noexcept override
    {
        return keyDigest(algorithm) != nullptr;
    }

    [[nodiscard]] credhash::security::SecureBuffer deriveKey(credhash::crypto::PasswordAlgorithm algorithm,
                                                            std::string_view password,
                                                            std::span<const std::uint8_t> salt,
                                                            std::uint32_t iterations) const override
    {
        const auto& info{ credhash::crypto::describe(algorithm) };
        if (!supports(algorithm))
        {
            throwUnsupported("deriveKey", info.name);
        }
        if (iterations == 0U)
        {
            throw std::invalid_argument("deriveKey: invalid iteration count");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies that are
        // wiped when they go out of scope.
        const auto* passwordBytes{ reinterpret_cast<const std::uint8_t*>(password.data()) };
        credhash::security::SecureBuffer passwordCopy{ credhash::security::secureCopy(
            std::span<const std::uint8_t>{ passwordBytes, password.size() }) };
        credhash::security::SecureBuffer saltCopy{ credhash::security::secureCopy(salt) };
        std::string digestName{ info.digestName };
        unsigned int iter{ iterations };
        // 1 disables the SP 800-132 lower bounds; legacy hashes may carry short salts or few iterations.
        int pkcs5{ 1 };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName.data(), 0),
            OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5),
            OSSL_PARAM_construct_end(),
        };

        credhash::security::SecureBuffer out{ credhash::security::zeroedBuffer(info.hashBytes) };
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] credhash::security::SecureBuffer digest(credhash::crypto::KeyAlgorithm algorithm,
                                                         std::span<const std::uint8_t> message) const override
    {
        const auto& info{ credhash::crypto::describe(algorithm) };
        const EVP_MD* md{ keyDigest(algorithm) };
        if (md == nullptr)
        {
            throwUnsupported("digest", info.name);
        }

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("digest: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), md, nullptr) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestInit_ex2 failed");
        }
        if (!message.empty() && EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestUpdate failed");
        }

        credhash::security::SecureBuffer out{ credhash::security::zeroedBuffer(EVP_MAX_MD_SIZE) };
        unsigned int written{ 0U };
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestFinal_ex failed");
        }
        if (written != info.hashBytes)
        {
            throw std::runtime_error("digest: unexpected digest length");
        }
        out.resize(written);
        return out;
    }

private:
    [[nodiscard]] const EVP_MD* passwordDigest(credhash::crypto::PasswordAlgorithm algorithm) const noexcept
    {
        const auto index{ static_cast<std::size_t>(algorithm) };
        return index < m_passwordDigests.size() ? m_passwordDigests[index].get() : nullptr;
    }

    [[nodiscard]] const EVP_MD* keyDigest(credhash::crypto::KeyAlgorithm algorithm) const noexcept
    {
        const auto index{ static_cast<std::size_t>(algorithm) };
        return index < m_keyDigests.size() ? m_keyDigests[index].get() : nullptr;
    }

    EvpKdfPtr m_pbkdf2{ nullptr, &EVP_KDF_free };
    std::vector<EvpMdPtr> m_passwordDigests;
    std::vector<EvpMdPtr> m_keyDigests;
};

} // namespace

[[nodiscard]] std::unique_ptr<credhash::crypto::IHashProvider> makeOpenSslHashProvider()
{
    return std::make_unique<OpenSslHashProvider>();
}

} // namespace credhash::crypto::providers
