#pragma once

#include <courier/directory_engine.hpp>
#include <courier/error.hpp>
#include <courier/event_sink.hpp>
#include <courier/remote_file.hpp>
#include <courier/transfer_engine.hpp>
#include <courier/transport_session.hpp>
#include <persistence/state/session_options.hpp>
#include <ssh/host_identity.hpp>
#include <ssh/transport_interface.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Courier
{
    /**
     * @brief A sftp client for one user on one host.
     * The connection is opened on first use and reopened transparently when it went stale.
     * Connection affecting settings (timeout, host identity, keep alive) can only be changed while disconnected.
     */
    class SftpClient
    {
      public:
        /**
         * @brief Creates a client that talks to the server through libssh.
         */
        explicit SftpClient(Persistence::SessionOptions options, std::shared_ptr<EventSink> events = {});

        SftpClient(
            std::shared_ptr<SecureShell::ITransport> transport,
            Persistence::SessionOptions options,
            std::shared_ptr<EventSink> events = {});

        ~SftpClient();
        SftpClient(SftpClient const&) = delete;
        SftpClient& operator=(SftpClient const&) = delete;
        SftpClient(SftpClient&&) = delete;
        SftpClient& operator=(SftpClient&&) = delete;

        // Configuration

        /// Negative values select the default of 30 seconds.
        std::expected<void, Error> setTimeout(std::chrono::milliseconds timeout);
        void setStrictMode(bool strictMode);
        void setOverwritePolicy(Persistence::OverwritePolicy policy);
        void setTransactional(bool transactional);
        void setCreateDirectoriesAutomatically(bool createDirectories);
        std::expected<void, Error> disableKeepAlive();
        std::expected<void, Error> enableKeepAlive(std::chrono::milliseconds interval);
        std::expected<void, Error> setHostKeyCheckDisabled(bool disabled);

        /**
         * @brief Trust exactly this key for the host. Re-enables the host key check.
         *
         * @param base64Key The key as in the second column of a known_hosts line.
         * @param type
         */
        std::expected<void, Error> setHostKey(std::string const& base64Key, SecureShell::HostKeyType type);

        /**
         * @brief Verify the host against this known_hosts file. Re-enables the host key check.
         */
        std::expected<void, Error> setKnownHostsFile(std::filesystem::path const& knownHostsFile);

        Persistence::SessionOptions options() const;

        // Connection

        std::expected<void, Error> connect();
        void disconnect();
        bool isConnected() const;

        // Files

        std::expected<void, Error> uploadFile(std::string const& remotePath, std::filesystem::path const& localPath);
        std::expected<void, Error> uploadStream(std::string const& remotePath, std::istream& source);
        std::expected<void, Error> uploadData(std::string const& remotePath, std::string const& data);
        std::expected<void, Error>
        uploadFiles(std::string const& remoteFolder, std::vector<std::filesystem::path> const& localFiles);
        std::expected<void, Error> downloadFile(std::string const& remotePath, std::filesystem::path const& localPath);
        std::expected<void, Error> downloadStream(std::string const& remotePath, std::ostream& sink);
        std::expected<std::string, Error> downloadData(std::string const& remotePath);
        std::expected<void, Error> downloadFiles(
            std::string const& remoteFolder,
            std::filesystem::path const& localFolder,
            std::string const& wildcard = "*");
        std::expected<void, Error> renameRemoteFile(std::string const& oldPath, std::string const& newPath);
        std::expected<void, Error> deleteRemoteFile(std::string const& remotePath);
        std::expected<std::optional<RemoteFile>, Error> statRemoteFile(std::string const& remotePath);
        std::expected<bool, Error> remoteFileExists(std::string const& remotePath);

        // Folders

        std::expected<std::vector<RemoteFile>, Error>
        listFiles(std::string const& remoteFolder, std::string const& wildcard = "*");
        std::expected<void, Error> createFolder(std::string const& remoteFolder);
        std::expected<void, Error> deleteFolder(std::string const& remoteFolder);
        std::expected<void, Error> deleteFiles(std::string const& remoteFolder, std::string const& wildcard);
        std::expected<void, Error> moveFiles(
            std::string const& sourceFolder,
            std::string const& destinationFolder,
            std::string const& wildcard);

        TransportSession& session()
        {
            return session_;
        }

      private:
        std::shared_ptr<EventSink> events_;
        TransportSession session_;
        TransferEngine transfers_;
        DirectoryEngine directories_;
    };
}
