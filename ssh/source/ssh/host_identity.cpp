#include <ssh/host_identity.hpp>

#include <array>
#include <utility>

namespace SecureShell
{
    namespace
    {
        constexpr std::array<std::pair<HostKeyType, std::string_view>, 5> keyTypeNames{{
            {HostKeyType::SshRsa, "ssh-rsa"},
            {HostKeyType::SshEd25519, "ssh-ed25519"},
            {HostKeyType::EcdsaSha2Nistp256, "ecdsa-sha2-nistp256"},
            {HostKeyType::EcdsaSha2Nistp384, "ecdsa-sha2-nistp384"},
            {HostKeyType::EcdsaSha2Nistp521, "ecdsa-sha2-nistp521"},
        }};
    }

    std::optional<HostKeyType> hostKeyTypeFromName(std::string_view name)
    {
        for (auto const& [type, typeName] : keyTypeNames)
        {
            if (typeName == name)
                return type;
        }
        return std::nullopt;
    }

    std::string_view hostKeyTypeName(HostKeyType type)
    {
        for (auto const& [candidate, typeName] : keyTypeNames)
        {
            if (candidate == type)
                return typeName;
        }
        return "unknown";
    }
}
