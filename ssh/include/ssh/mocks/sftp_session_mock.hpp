#pragma once

#include <ssh/sftp_session_interface.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class SftpSessionMock : public SecureShell::ISftpSession
    {
      public:
        MOCK_METHOD(bool, isClosed, (), (const, override));
        MOCK_METHOD(bool, isEof, (), (const, override));
        MOCK_METHOD((std::expected<FileInformation, SftpError>), stat, (std::string const& path), (override));
        MOCK_METHOD(
            (std::expected<std::vector<FileInformation>, SftpError>),
            listDirectory,
            (std::string const& path),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            download,
            (std::string const& remotePath, std::ostream& sink),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            upload,
            (std::istream & source, std::string const& remotePath),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            rename,
            (std::string const& from, std::string const& to),
            (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeFile, (std::string const& path), (override));
        MOCK_METHOD((std::expected<void, SftpError>), createDirectory, (std::string const& path), (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeDirectory, (std::string const& path), (override));
        MOCK_METHOD((std::expected<void, SftpError>), close, (), (override));
    };
}
