#pragma once

#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief How the identity of the remote host is verified.
     * A disabled check wins over everything else, then the known_hosts file, then the explicit key.
     */
    struct HostIdentityOptions
    {
        std::optional<bool> disableCheck{std::nullopt};
        /// Base64 encoded public key blob, as found in the second column of a known_hosts line.
        std::optional<std::string> hostKey{std::nullopt};
        /// OpenSSH key type name, e.g. "ssh-rsa" or "ssh-ed25519".
        std::optional<std::string> hostKeyType{std::nullopt};
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};

        void useDefaultsFrom(HostIdentityOptions const& other);
    };
    void to_json(nlohmann::json& j, HostIdentityOptions const& options);
    void from_json(nlohmann::json const& j, HostIdentityOptions& options);
}
