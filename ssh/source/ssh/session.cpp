#include <ssh/session.hpp>
#include <ssh/sftp_session.hpp>
#include <log/log.hpp>

#include <fmt/format.h>
#include <libssh/sftp.h>

#include <memory>
#include <string_view>

namespace SecureShell
{
    namespace
    {
        std::string authResultName(int result)
        {
            switch (result)
            {
                case SSH_AUTH_SUCCESS:
                    return "Authentication succeeded";
                case SSH_AUTH_DENIED:
                    return "Authentication denied";
                case SSH_AUTH_ERROR:
                    return "Authentication error";
                case SSH_AUTH_PARTIAL:
                    return "Partial authentication";
                case SSH_AUTH_AGAIN:
                    return "Authentication again";
                default:
                    return "Unknown authentication result";
            }
        }

        std::string knownHostsResultName(ssh_known_hosts_e result)
        {
            switch (result)
            {
                case SSH_KNOWN_HOSTS_OK:
                    return "host key is known";
                case SSH_KNOWN_HOSTS_CHANGED:
                    return "host key changed";
                case SSH_KNOWN_HOSTS_OTHER:
                    return "host key of another type is known for this host";
                case SSH_KNOWN_HOSTS_NOT_FOUND:
                    return "known hosts file not found";
                case SSH_KNOWN_HOSTS_UNKNOWN:
                    return "host is unknown";
                case SSH_KNOWN_HOSTS_ERROR:
                default:
                    return "known hosts check failed";
            }
        }
    }

    Session::Session(SessionParameters parameters)
        : parameters_{std::move(parameters)}
        , guard_{std::make_shared<std::recursive_mutex>()}
        , session_{}
        , connected_{false}
    {}

    Session::~Session()
    {
        std::scoped_lock lock{*guard_};
        if (connected_)
            session_.disconnect();
    }

    std::expected<std::unique_ptr<Session>, SftpError> Session::create(SessionParameters const& parameters)
    {
        auto session = std::make_unique<Session>(parameters);
        if (const auto result = session->applyOptions(); result != SSH_OK)
            return std::unexpected(session->lastError(result));
        return session;
    }

    int Session::applyOptions()
    {
        const auto timeoutMilliseconds = parameters_.connectTimeout.count();
        const int port = parameters_.port;
        const long timeoutSeconds = static_cast<long>(timeoutMilliseconds / 1000);
        const long timeoutMicroseconds = static_cast<long>((timeoutMilliseconds % 1000) * 1000);

        const auto apply = [this](ssh_options_e option, void const* value, std::string_view name) {
            const auto result = ssh_options_set(session_.getCSession(), option, value);
            if (result != SSH_OK)
                Log::error("Failed to apply ssh option '{}' for host '{}'", name, parameters_.host);
            return result;
        };

        if (const auto result = apply(SSH_OPTIONS_HOST, parameters_.host.c_str(), "host"); result != SSH_OK)
            return result;
        if (const auto result = apply(SSH_OPTIONS_PORT, &port, "port"); result != SSH_OK)
            return result;
        if (!parameters_.user.empty())
        {
            if (const auto result = apply(SSH_OPTIONS_USER, parameters_.user.c_str(), "user"); result != SSH_OK)
                return result;
        }
        if (const auto result = apply(SSH_OPTIONS_TIMEOUT, &timeoutSeconds, "timeout"); result != SSH_OK)
            return result;
        return apply(SSH_OPTIONS_TIMEOUT_USEC, &timeoutMicroseconds, "timeout_usec");
    }

    std::expected<void, SftpError> Session::connect(HostIdentity const& identity)
    {
        std::scoped_lock lock{*guard_};

        if (identity.mode == HostIdentity::Mode::KnownHostsFile)
        {
            const auto result =
                session_.setOption(SSH_OPTIONS_KNOWNHOSTS, identity.knownHostsFile.generic_string().c_str());
            if (result != SSH_OK)
                return std::unexpected(lastError(result));
        }

        if (const auto result = session_.connect(); result != SSH_OK)
            return std::unexpected(lastError(result));
        connected_ = true;

        if (auto verified = verifyHost(identity); !verified)
        {
            session_.disconnect();
            connected_ = false;
            return verified;
        }
        return {};
    }

    std::expected<void, SftpError> Session::verifyHost(HostIdentity const& identity)
    {
        switch (identity.mode)
        {
            case HostIdentity::Mode::Skip:
                return {};
            case HostIdentity::Mode::TrustedKey:
                return verifyTrustedKey(identity);
            case HostIdentity::Mode::KnownHostsFile:
            case HostIdentity::Mode::TransportDefault:
            {
                const auto state = ssh_session_is_known_server(session_.getCSession());
                if (state == SSH_KNOWN_HOSTS_OK)
                    return {};
                return std::unexpected(SftpError{
                    .message = fmt::format(
                        "Host verification failed for '{}': {}", parameters_.host, knownHostsResultName(state)),
                    .sshError = SSH_ERROR,
                    .sftpError = 0,
                });
            }
        }
        return {};
    }

    std::expected<void, SftpError> Session::verifyTrustedKey(HostIdentity const& identity)
    {
        ssh_key serverKey{nullptr};
        if (const auto result = ssh_get_server_publickey(session_.getCSession(), &serverKey); result != SSH_OK)
            return std::unexpected(lastError(result));
        std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> keyGuard{serverKey, ssh_key_free};

        const std::string expectedTypeName{hostKeyTypeName(identity.keyType)};
        if (ssh_key_type(serverKey) != ssh_key_type_from_name(expectedTypeName.c_str()))
        {
            return std::unexpected(SftpError{
                .message = fmt::format(
                    "Host key of '{}' is of type '{}', expected '{}'",
                    identity.host,
                    ssh_key_type_to_char(ssh_key_type(serverKey)),
                    expectedTypeName),
                .sshError = SSH_ERROR,
                .sftpError = 0,
            });
        }

        ssh_string blob{nullptr};
        if (const auto result = ssh_pki_export_pubkey_blob(serverKey, &blob); result != SSH_OK)
            return std::unexpected(lastError(result));
        const std::string serverBlob{static_cast<char const*>(ssh_string_data(blob)), ssh_string_len(blob)};
        ssh_string_free(blob);

        if (serverBlob != identity.keyBlob)
        {
            return std::unexpected(SftpError{
                .message = fmt::format("Host key of '{}' does not match the trusted key", identity.host),
                .sshError = SSH_ERROR,
                .sftpError = 0,
            });
        }
        return {};
    }

    std::expected<void, SftpError> Session::authenticateWithPassword(std::string const& password)
    {
        std::scoped_lock lock{*guard_};
        const auto result = session_.userauthPassword(password.c_str());
        if (result != SSH_AUTH_SUCCESS)
        {
            return std::unexpected(SftpError{
                .message = fmt::format("Failed to authenticate: {}", authResultName(result)),
                .sshError = result,
                .sftpError = 0,
            });
        }
        return {};
    }

    std::expected<void, SftpError> Session::authenticateWithPrivateKey(
        std::filesystem::path const& privateKeyFile,
        std::optional<std::string> const& passphrase)
    {
        std::scoped_lock lock{*guard_};

        ssh_key key{nullptr};
        const auto imported = ssh_pki_import_privkey_file(
            privateKeyFile.string().c_str(), passphrase ? passphrase->c_str() : nullptr, nullptr, nullptr, &key);
        std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> keyGuard{key, ssh_key_free};
        if (imported != SSH_OK)
        {
            return std::unexpected(SftpError{
                .message = fmt::format("Failed to import private key '{}'", privateKeyFile.string()),
                .sshError = imported,
                .sftpError = 0,
            });
        }

        if (const auto result = session_.userauthPublickey(key); result != SSH_AUTH_SUCCESS)
        {
            return std::unexpected(SftpError{
                .message = fmt::format("Failed to authenticate: {}", authResultName(result)),
                .sshError = result,
                .sftpError = 0,
            });
        }
        return {};
    }

    std::expected<std::unique_ptr<ISftpSession>, SftpError> Session::openSftp()
    {
        std::scoped_lock lock{*guard_};

        auto sftp = sftp_new(session_.getCSession());
        if (sftp == nullptr)
            return std::unexpected(lastError(ssh_get_error_code(session_.getCSession())));

        if (const auto result = sftp_init(sftp); result != SSH_OK)
        {
            auto error = SftpError{
                .message = ssh_get_error(session_.getCSession()),
                .sshError = result,
                .sftpError = sftp_get_error(sftp),
            };
            sftp_free(sftp);
            return std::unexpected(std::move(error));
        }

        return std::make_unique<SftpSession>(guard_, sftp);
    }

    std::expected<void, SftpError> Session::sendKeepAlive()
    {
        std::scoped_lock lock{*guard_};
        if (const auto result = ssh_send_ignore(session_.getCSession(), "keepalive"); result != SSH_OK)
            return std::unexpected(lastError(result));
        return {};
    }

    bool Session::isConnected() const
    {
        std::scoped_lock lock{*guard_};
        return connected_ && ssh_is_connected(session_.getCSession()) != 0;
    }

    std::expected<void, SftpError> Session::disconnect()
    {
        std::scoped_lock lock{*guard_};
        if (!connected_)
            return {};
        session_.disconnect();
        connected_ = false;
        return {};
    }

    SftpError Session::lastError(int code) const
    {
        return SftpError{
            .message = ssh_get_error(session_.getCSession()),
            .sshError = code,
            .sftpError = 0,
        };
    }
}
