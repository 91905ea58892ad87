#pragma once

#include <ssh/session_interface.hpp>
#include <ssh/transport_interface.hpp>

#include <libssh/libsshpp.hpp>

#include <expected>
#include <memory>
#include <mutex>

namespace SecureShell
{
    /**
     * @brief libssh implementation of ISession.
     * All calls on the underlying ssh_session are serialized through a recursive mutex that is shared with the
     * sftp session opened from it, because keep alive and transfers may run on different threads.
     */
    class Session : public ISession
    {
      public:
        explicit Session(SessionParameters parameters);
        ~Session() override;
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        /**
         * @brief Creates a session and applies host, port, user and timeout.
         */
        static std::expected<std::unique_ptr<Session>, SftpError> create(SessionParameters const& parameters);

        std::expected<void, SftpError> connect(HostIdentity const& identity) override;
        std::expected<void, SftpError> authenticateWithPassword(std::string const& password) override;
        std::expected<void, SftpError> authenticateWithPrivateKey(
            std::filesystem::path const& privateKeyFile,
            std::optional<std::string> const& passphrase) override;
        std::expected<std::unique_ptr<ISftpSession>, SftpError> openSftp() override;
        std::expected<void, SftpError> sendKeepAlive() override;
        bool isConnected() const override;
        std::expected<void, SftpError> disconnect() override;

        operator ssh::Session&()
        {
            return session_;
        }

      private:
        int applyOptions();
        std::expected<void, SftpError> verifyHost(HostIdentity const& identity);
        std::expected<void, SftpError> verifyTrustedKey(HostIdentity const& identity);
        SftpError lastError(int code) const;

      private:
        SessionParameters parameters_;
        std::shared_ptr<std::recursive_mutex> guard_;
        // mutable for the const libsshpp accessors that are not declared const
        mutable ssh::Session session_;
        bool connected_;
    };
}
