#pragma once

#include <ssh/session_interface.hpp>
#include <ssh/sftp_session_interface.hpp>

#include <atomic>
#include <memory>

namespace Courier
{
    /**
     * @brief One live ssh session together with its sftp channel.
     * Handed out as shared_ptr, a handle kept across a reconnect stays a valid object but reports closed.
     */
    class Connection
    {
      public:
        Connection(std::unique_ptr<SecureShell::ISession> session, std::unique_ptr<SecureShell::ISftpSession> sftp);
        ~Connection();
        Connection(Connection const&) = delete;
        Connection& operator=(Connection const&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        SecureShell::ISession& session()
        {
            return *session_;
        }
        SecureShell::ISftpSession& sftp()
        {
            return *sftp_;
        }

        /**
         * @brief Closes the sftp channel, then the session. Idempotent, errors are logged.
         */
        void close();

        bool isClosed() const
        {
            return closed_.load();
        }

      private:
        std::unique_ptr<SecureShell::ISession> session_;
        std::unique_ptr<SecureShell::ISftpSession> sftp_;
        std::atomic_bool closed_;
    };
}
