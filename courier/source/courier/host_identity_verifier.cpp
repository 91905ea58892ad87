#include <courier/host_identity_verifier.hpp>
#include <log/log.hpp>
#include <utility/file_access.hpp>

#include <roar/utility/base64.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace Courier
{
    namespace
    {
        bool looksLikeBase64(std::string const& encoded)
        {
            if (encoded.empty() || encoded.size() % 4 != 0)
                return false;

            const auto padding = encoded.find('=');
            if (padding != std::string::npos)
            {
                if (encoded.size() - padding > 2)
                    return false;
                if (std::any_of(encoded.begin() + static_cast<std::ptrdiff_t>(padding), encoded.end(), [](char c) {
                        return c != '=';
                    }))
                    return false;
            }

            const auto dataEnd = encoded.begin() + static_cast<std::ptrdiff_t>(std::min(padding, encoded.size()));
            return std::all_of(encoded.begin(), dataEnd, [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
            });
        }
    }

    std::expected<SecureShell::HostIdentity, Error>
    resolveHostIdentity(Persistence::HostIdentityOptions const& options, std::string const& host)
    {
        using Mode = SecureShell::HostIdentity::Mode;

        if (options.disableCheck.value_or(false))
        {
            Log::warn("Host key check is disabled for '{}'", host);
            return SecureShell::HostIdentity{.mode = Mode::Skip, .host = host};
        }

        if (options.knownHostsFile)
        {
            if (!Utility::isReadableFile(*options.knownHostsFile))
            {
                return std::unexpected(Error{
                    .type = ErrorType::ConfigurationError,
                    .message = fmt::format("Cannot read known_hosts file '{}'", options.knownHostsFile->string()),
                });
            }
            Log::debug("Using known_hosts file '{}'", options.knownHostsFile->string());
            return SecureShell::HostIdentity{
                .mode = Mode::KnownHostsFile,
                .host = host,
                .knownHostsFile = *options.knownHostsFile,
            };
        }

        if (options.hostKey && !options.hostKey->empty())
        {
            const auto typeName = options.hostKeyType.value_or("ssh-rsa");
            const auto keyType = SecureShell::hostKeyTypeFromName(typeName);
            if (!keyType)
            {
                return std::unexpected(Error{
                    .type = ErrorType::ConfigurationError,
                    .message = fmt::format("Unsupported host key type '{}'", typeName),
                });
            }

            if (!looksLikeBase64(*options.hostKey))
            {
                return std::unexpected(Error{
                    .type = ErrorType::ConfigurationError,
                    .message = fmt::format("Host key for '{}' is not valid base64", host),
                });
            }
            auto blob = Roar::base64Decode(*options.hostKey);
            if (blob.empty())
            {
                return std::unexpected(Error{
                    .type = ErrorType::ConfigurationError,
                    .message = fmt::format("Host key for '{}' decodes to nothing", host),
                });
            }

            Log::debug("Using host key of type '{}' for '{}'", typeName, host);
            return SecureShell::HostIdentity{
                .mode = Mode::TrustedKey,
                .host = host,
                .keyType = *keyType,
                .keyBlob = std::move(blob),
            };
        }

        Log::warn("Host key check is not disabled, but neither a host key nor a known_hosts file is provided");
        return SecureShell::HostIdentity{.mode = Mode::TransportDefault, .host = host};
    }
}
