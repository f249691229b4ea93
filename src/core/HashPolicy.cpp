#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include <string>

namespace credhash::core
{

[[nodiscard]] PasswordPolicy defaultPasswordPolicy() noexcept
{
    constexpr std::uint32_t kRecommendedIterations{ 25000U };

    return PasswordPolicy{
        .algorithm = crypto::PasswordAlgorithm::Pbkdf2WithHmacSha512,
        .iterations = kRecommendedIterations,
    };
}

[[nodiscard]] crypto::KeyAlgorithm recommendedKeyAlgorithm() noexcept
{
    return crypto::KeyAlgorithm::Sha256;
}

[[nodiscard]] bool isWeakerThan(const PasswordPolicy& used, const PasswordPolicy& recommended) noexcept
{
    return used.algorithm < recommended.algorithm || used.iterations < recommended.iterations;
}

[[nodiscard]] crypto::PasswordAlgorithm requirePasswordAlgorithm(std::string_view name)
{
    if (const auto algorithm{ crypto::findPasswordAlgorithm(name) }; algorithm.has_value())
    {
        return *algorithm;
    }
    throw CredentialError(CredentialErrc::UnsupportedAlgorithm, "Unsupported algorithm: " + std::string{ name });
}

[[nodiscard]] crypto::KeyAlgorithm requireKeyAlgorithm(std::string_view name)
{
    if (const auto algorithm{ crypto::findKeyAlgorithm(name) }; algorithm.has_value())
    {
        return *algorithm;
    }
    throw CredentialError(CredentialErrc::UnsupportedAlgorithm, "Unsupported algorithm: " + std::string{ name });
}

void requireIterations(std::uint32_t iterations)
{
    if (iterations < 1U || iterations > g_kMaxIterations)
    {
        throw CredentialError(CredentialErrc::InvalidIterationCount, "Invalid iterations: " + std::to_string(iterations));
    }
}

} // namespace credhash::core
