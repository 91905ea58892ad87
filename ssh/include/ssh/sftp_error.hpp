#pragma once

#include <fmt/format.h>

#include <string>

namespace SecureShell
{
    /// SFTP status codes (draft-ietf-secsh-filexfer-02) the callers care about.
    namespace SftpStatus
    {
        constexpr int ok = 0;
        constexpr int eof = 1;
        constexpr int noSuchFile = 2;
        constexpr int permissionDenied = 3;
        constexpr int failure = 4;
    }

    struct SftpError
    {
        std::string message;
        int sshError = 0;
        int sftpError = 0;

        bool isNoSuchFile() const
        {
            return sftpError == SftpStatus::noSuchFile;
        }

        inline std::string toString() const
        {
            return fmt::format("SftpError: message: {}, sshError: {}, sftpError: {}", message, sshError, sftpError);
        }
    };
}
