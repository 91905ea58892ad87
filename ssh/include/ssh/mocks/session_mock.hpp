#pragma once

#include <ssh/session_interface.hpp>
#include <ssh/transport_interface.hpp>

#include <gmock/gmock.h>

namespace SecureShell::Test
{
    class SessionMock : public SecureShell::ISession
    {
      public:
        MOCK_METHOD((std::expected<void, SftpError>), connect, (HostIdentity const& identity), (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            authenticateWithPassword,
            (std::string const& password),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            authenticateWithPrivateKey,
            (std::filesystem::path const& privateKeyFile, std::optional<std::string> const& passphrase),
            (override));
        MOCK_METHOD((std::expected<std::unique_ptr<ISftpSession>, SftpError>), openSftp, (), (override));
        MOCK_METHOD((std::expected<void, SftpError>), sendKeepAlive, (), (override));
        MOCK_METHOD(bool, isConnected, (), (const, override));
        MOCK_METHOD((std::expected<void, SftpError>), disconnect, (), (override));
    };

    class TransportMock : public SecureShell::ITransport
    {
      public:
        MOCK_METHOD(
            (std::expected<std::unique_ptr<ISession>, SftpError>),
            createSession,
            (SessionParameters const& parameters),
            (override));
    };
}
