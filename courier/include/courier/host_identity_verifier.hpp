#pragma once

#include <courier/error.hpp>
#include <persistence/state/host_identity_options.hpp>
#include <ssh/host_identity.hpp>

#include <expected>
#include <string>

namespace Courier
{
    /**
     * @brief Turns the configured host identity options into the verification the session performs.
     * Precedence: disabled check, known_hosts file, explicit key, transport default.
     *
     * @param options
     * @param host The host the key is trusted for.
     * @return std::expected<SecureShell::HostIdentity, Error> ConfigurationError on unreadable known_hosts files, bad
     * base64 or unknown key types.
     */
    std::expected<SecureShell::HostIdentity, Error>
    resolveHostIdentity(Persistence::HostIdentityOptions const& options, std::string const& host);
}
