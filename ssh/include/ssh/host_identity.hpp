#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace SecureShell
{
    enum class HostKeyType
    {
        SshRsa,
        SshEd25519,
        EcdsaSha2Nistp256,
        EcdsaSha2Nistp384,
        EcdsaSha2Nistp521,
    };

    /**
     * @brief Maps OpenSSH key type names ("ssh-rsa", "ssh-ed25519", ...) to HostKeyType.
     */
    std::optional<HostKeyType> hostKeyTypeFromName(std::string_view name);
    std::string_view hostKeyTypeName(HostKeyType type);

    /**
     * @brief The host verification a session performs right after the key exchange.
     */
    struct HostIdentity
    {
        enum class Mode
        {
            /// No verification at all.
            Skip,
            /// Whatever the transport does by default (libssh: the users known_hosts).
            TransportDefault,
            /// Verify against the given known_hosts file.
            KnownHostsFile,
            /// The server key must equal the given key.
            TrustedKey,
        };

        Mode mode{Mode::TransportDefault};
        std::string host{};
        std::filesystem::path knownHostsFile{};
        HostKeyType keyType{HostKeyType::SshRsa};
        /// Decoded public key blob (ssh wire format).
        std::string keyBlob{};
    };
}
