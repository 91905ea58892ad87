#pragma once

#include <ssh/file_information.hpp>
#include <ssh/sftp_error.hpp>

#include <expected>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace SecureShell
{
    /**
     * @brief An open sftp subsystem channel. All calls block until the server answered.
     * Remote paths are '/' separated strings as the server understands them.
     */
    class ISftpSession
    {
      public:
        ISftpSession() = default;
        virtual ~ISftpSession() = default;
        ISftpSession(ISftpSession const&) = delete;
        ISftpSession& operator=(ISftpSession const&) = delete;
        ISftpSession(ISftpSession&&) = delete;
        ISftpSession& operator=(ISftpSession&&) = delete;

        /**
         * @brief Returns true if the underlying channel was closed.
         */
        virtual bool isClosed() const = 0;

        /**
         * @brief Returns true if the remote side sent EOF on the channel.
         */
        virtual bool isEof() const = 0;

        /**
         * @brief Gets the attributes of a file or directory. Follows symlinks.
         *
         * @param path
         * @return std::expected<FileInformation, SftpError>
         */
        virtual std::expected<FileInformation, SftpError> stat(std::string const& path) = 0;

        /**
         * @brief Lists the contents of a directory, including "." and ".." if the server reports them.
         *
         * @param path
         * @return std::expected<std::vector<FileInformation>, SftpError>
         */
        virtual std::expected<std::vector<FileInformation>, SftpError> listDirectory(std::string const& path) = 0;

        /**
         * @brief Streams the remote file into sink.
         */
        virtual std::expected<void, SftpError> download(std::string const& remotePath, std::ostream& sink) = 0;

        /**
         * @brief Creates or truncates the remote file and writes everything readable from source into it.
         */
        virtual std::expected<void, SftpError> upload(std::istream& source, std::string const& remotePath) = 0;

        /**
         * @brief Move a file or directory. Replaces an existing target where the server supports posix-rename.
         */
        virtual std::expected<void, SftpError> rename(std::string const& from, std::string const& to) = 0;

        virtual std::expected<void, SftpError> removeFile(std::string const& path) = 0;

        /**
         * @brief Creates a single directory. The parent must exist.
         */
        virtual std::expected<void, SftpError> createDirectory(std::string const& path) = 0;

        /**
         * @brief Removes an empty directory.
         */
        virtual std::expected<void, SftpError> removeDirectory(std::string const& path) = 0;

        /**
         * @brief Closes the channel. Further calls fail.
         */
        virtual std::expected<void, SftpError> close() = 0;
    };
}
