#include "credhash/core/CredentialErrors.hpp"

namespace credhash::core
{

std::string_view toString(CredentialErrc code) noexcept
{
    switch (code)
    {
    case CredentialErrc::UnsupportedAlgorithm:
        return "UnsupportedAlgorithm";
    case CredentialErrc::InvalidFormat:
        return "InvalidFormat";
    case CredentialErrc::InvalidLength:
        return "InvalidLength";
    case CredentialErrc::InvalidIterationCount:
        return "InvalidIterationCount";
    case CredentialErrc::ReservedValue:
        return "ReservedValue";
    }
    return "Unknown";
}

} // namespace credhash::core
