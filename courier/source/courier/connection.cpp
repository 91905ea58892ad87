#include <courier/connection.hpp>
#include <log/log.hpp>

namespace Courier
{
    Connection::Connection(
        std::unique_ptr<SecureShell::ISession> session,
        std::unique_ptr<SecureShell::ISftpSession> sftp)
        : session_{std::move(session)}
        , sftp_{std::move(sftp)}
        , closed_{false}
    {}

    Connection::~Connection()
    {
        close();
    }

    void Connection::close()
    {
        if (closed_.exchange(true))
            return;

        if (auto result = sftp_->close(); !result)
            Log::warn("Error while closing sftp channel: {}", result.error().toString());
        if (auto result = session_->disconnect(); !result)
            Log::warn("Error while disconnecting: {}", result.error().toString());
    }
}
