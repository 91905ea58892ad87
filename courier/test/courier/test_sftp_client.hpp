#pragma once

#include "fake_sftp_server.hpp"
#include "recording_event_sink.hpp"

#include <courier/sftp_client.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace std::chrono_literals;

namespace Test
{
    class SftpClientTests : public ::testing::Test
    {
      protected:
        SftpClientTests()
            : client_{std::make_shared<FakeTransport>(server_), makeOptions(), events_}
        {}

        static Persistence::SessionOptions makeOptions()
        {
            Persistence::SessionOptions options{};
            options.host = "sftp.example.com";
            options.user = "deploy";
            options.password = "secret";
            return options;
        }

      protected:
        std::shared_ptr<FakeSftpServer> server_ = std::make_shared<FakeSftpServer>();
        std::shared_ptr<RecordingEventSink> events_ = std::make_shared<RecordingEventSink>();
        Courier::SftpClient client_;
    };

    TEST_F(SftpClientTests, ConnectTwiceOpensOneSession)
    {
        ASSERT_TRUE(client_.connect().has_value());
        ASSERT_TRUE(client_.connect().has_value());

        EXPECT_TRUE(client_.isConnected());
        EXPECT_EQ(server_->sessionsCreated.load(), 1);

        client_.disconnect();
        EXPECT_FALSE(client_.isConnected());
    }

    TEST_F(SftpClientTests, NegativeTimeoutSelectsDefault)
    {
        ASSERT_TRUE(client_.setTimeout(-1ms).has_value());
        EXPECT_EQ(client_.options().effectiveConnectTimeout(), 30'000ms);

        ASSERT_TRUE(client_.setTimeout(2'000ms).has_value());
        ASSERT_TRUE(client_.connect().has_value());
        EXPECT_EQ(server_->lastParameters.connectTimeout, 2'000ms);
    }

    TEST_F(SftpClientTests, ConnectionSettingsAreLockedWhileConnected)
    {
        ASSERT_TRUE(client_.connect().has_value());

        EXPECT_EQ(client_.setTimeout(1s).error().type, Courier::ErrorType::StateError);
        EXPECT_EQ(client_.enableKeepAlive(1s).error().type, Courier::ErrorType::StateError);
        EXPECT_EQ(client_.disableKeepAlive().error().type, Courier::ErrorType::StateError);
        EXPECT_EQ(client_.setHostKeyCheckDisabled(true).error().type, Courier::ErrorType::StateError);
        EXPECT_EQ(
            client_.setKnownHostsFile("/etc/ssh/ssh_known_hosts").error().type, Courier::ErrorType::StateError);
    }

    TEST_F(SftpClientTests, TransferSettingsCanChangeWhileConnected)
    {
        ASSERT_TRUE(client_.connect().has_value());

        client_.setStrictMode(false);
        client_.setOverwritePolicy(Persistence::OverwritePolicy::AddSuffixAfterExtension);
        client_.setTransactional(false);
        client_.setCreateDirectoriesAutomatically(true);

        const auto options = client_.options();
        EXPECT_FALSE(options.strictMode());
        EXPECT_EQ(options.overwritePolicy(), Persistence::OverwritePolicy::AddSuffixAfterExtension);
        EXPECT_FALSE(options.transactional());
        EXPECT_TRUE(options.createDirectoriesAutomatically());
    }

    TEST_F(SftpClientTests, SettingHostKeyReenablesTheCheck)
    {
        ASSERT_TRUE(client_.setHostKeyCheckDisabled(true).has_value());
        ASSERT_TRUE(client_.setHostKey("AAAAC3NzaC1lZDI1NTE5AAAAIA==", SecureShell::HostKeyType::SshEd25519).has_value());

        const auto identity = client_.options().hostIdentityOptions;
        EXPECT_EQ(identity.disableCheck, false);
        EXPECT_EQ(identity.hostKeyType, "ssh-ed25519");
        EXPECT_EQ(identity.hostKey, "AAAAC3NzaC1lZDI1NTE5AAAAIA==");
    }

    TEST_F(SftpClientTests, UploadListAndDownloadThroughTheFacade)
    {
        client_.setCreateDirectoriesAutomatically(true);

        ASSERT_TRUE(client_.uploadData("/outgoing/today/report.csv", "1;2;3").has_value());
        ASSERT_TRUE(client_.createFolder("/outgoing/archive").has_value());

        const auto files = client_.listFiles("/outgoing/today", "*.csv");
        ASSERT_TRUE(files.has_value());
        ASSERT_EQ(files->size(), 1u);
        EXPECT_EQ(files->front().size(), 5u);

        std::ostringstream sink{};
        ASSERT_TRUE(client_.downloadStream("/outgoing/today/report.csv", sink).has_value());
        EXPECT_EQ(sink.str(), "1;2;3");

        ASSERT_TRUE(client_.moveFiles("/outgoing/today", "/outgoing/archive", "*").has_value());
        const auto exists = client_.remoteFileExists("/outgoing/archive/report.csv");
        ASSERT_TRUE(exists.has_value());
        EXPECT_TRUE(*exists);

        ASSERT_TRUE(client_.deleteFolder("/outgoing").has_value());
        EXPECT_FALSE(server_->exists("/outgoing"));
    }
}
