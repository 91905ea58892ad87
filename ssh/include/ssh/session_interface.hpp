#pragma once

#include <ssh/host_identity.hpp>
#include <ssh/sftp_error.hpp>
#include <ssh/sftp_session_interface.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace SecureShell
{
    /**
     * @brief One ssh connection. Created unconnected by an ITransport.
     */
    class ISession
    {
      public:
        ISession() = default;
        virtual ~ISession() = default;
        ISession(ISession const&) = delete;
        ISession& operator=(ISession const&) = delete;
        ISession(ISession&&) = delete;
        ISession& operator=(ISession&&) = delete;

        /**
         * @brief Opens the connection, performs the key exchange and verifies the host as described by identity.
         */
        virtual std::expected<void, SftpError> connect(HostIdentity const& identity) = 0;

        virtual std::expected<void, SftpError> authenticateWithPassword(std::string const& password) = 0;

        virtual std::expected<void, SftpError> authenticateWithPrivateKey(
            std::filesystem::path const& privateKeyFile,
            std::optional<std::string> const& passphrase) = 0;

        /**
         * @brief Opens the sftp subsystem. The returned object must not outlive this session.
         */
        virtual std::expected<std::unique_ptr<ISftpSession>, SftpError> openSftp() = 0;

        /**
         * @brief Sends a message the server has to read but not answer, proves the connection is usable.
         */
        virtual std::expected<void, SftpError> sendKeepAlive() = 0;

        virtual bool isConnected() const = 0;

        virtual std::expected<void, SftpError> disconnect() = 0;
    };
}
