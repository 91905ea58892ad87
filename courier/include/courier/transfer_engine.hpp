#pragma once

#include <courier/conflict_resolver.hpp>
#include <courier/error.hpp>
#include <courier/event_sink.hpp>
#include <courier/remote_file.hpp>
#include <courier/transport_session.hpp>

#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace Courier
{
    /**
     * @brief Single file transfers and file primitives.
     * Transactional transfers write to a random ".<name>" next to the destination and rename it into place.
     * Strict mode, overwrite policy and the other transfer options are read from the session on every call.
     */
    class TransferEngine
    {
      public:
        /// Length of the random part of temporary file names.
        constexpr static std::size_t temporaryNameLength = 25;

        TransferEngine(TransportSession& session, std::shared_ptr<EventSink> events);

        std::expected<void, Error> uploadFile(std::string const& remotePath, std::filesystem::path const& localPath);
        std::expected<void, Error> uploadStream(std::string const& remotePath, std::istream& source);

        /**
         * @brief Uploads an in-memory buffer. Only meant for small payloads.
         */
        std::expected<void, Error> uploadData(std::string const& remotePath, std::string const& data);

        std::expected<void, Error> downloadFile(std::string const& remotePath, std::filesystem::path const& localPath);
        std::expected<void, Error> downloadStream(std::string const& remotePath, std::ostream& sink);

        /**
         * @brief Downloads a remote file into memory. Only meant for small files.
         */
        std::expected<std::string, Error> downloadData(std::string const& remotePath);

        /**
         * @brief Renames or moves a single remote file.
         */
        std::expected<void, Error> renameRemoteFile(std::string const& oldPath, std::string const& newPath);

        /**
         * @brief Rename primitive without the strict file check of renameRemoteFile, works for folders too.
         */
        std::expected<void, Error> renameRemoteEntry(std::string const& oldPath, std::string const& newPath);

        std::expected<void, Error> deleteRemoteFile(std::string const& remotePath);

        /**
         * @brief Stat a remote path.
         *
         * @return std::nullopt if the path does not exist, errors only if no connection could be made.
         */
        std::expected<std::optional<RemoteFile>, Error> statRemoteFile(std::string const& remotePath);

        std::expected<bool, Error> remoteFileExists(std::string const& remotePath);

        /**
         * @brief Creates a remote folder and every missing ancestor, shallowest first.
         * Already created folders stay if a later mkdir fails.
         */
        std::expected<void, Error> createRemoteFolder(std::string const& remoteFolder);

        /**
         * @brief In strict mode the remote folder must exist. Creates it if createIfMissing, regardless of strict mode.
         */
        std::expected<void, Error> prepareRemoteFolder(std::string const& remoteFolder, bool createIfMissing);

        /**
         * @brief In strict mode the remote path must exist and be a regular file.
         */
        std::expected<void, Error> requireRemoteFile(std::string const& remotePath);

        /**
         * @brief In strict mode the local folder must exist. Creates it if createIfMissing, regardless of strict mode.
         */
        std::expected<void, Error> prepareLocalFolder(std::filesystem::path const& localFolder, bool createIfMissing);

        /**
         * @brief In strict mode the local file must be readable.
         */
        std::expected<void, Error> requireLocalFile(std::filesystem::path const& localPath);

        TransportSession& session()
        {
            return *session_;
        }

      private:
        std::expected<void, Error> uploadInternal(std::string const& remotePath, std::istream& source);
        std::expected<void, Error> downloadInternal(std::string const& remotePath, std::filesystem::path const& localPath);
        std::expected<void, Error> failTransfer(std::string const& target, Error error);
        Error transferError(std::string const& context, SecureShell::SftpError const& cause);
        void removeRemoteTemporary(std::string const& temporaryPath);

      private:
        TransportSession* session_;
        std::shared_ptr<EventSink> events_;
    };
}
