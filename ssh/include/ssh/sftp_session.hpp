#pragma once

#include <ssh/sftp_session_interface.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <memory>
#include <mutex>

namespace SecureShell
{
    /**
     * @brief libssh implementation of ISftpSession. Owns the sftp_session, not the ssh_session it runs on.
     */
    class SftpSession : public ISftpSession
    {
      public:
        /// Read and write chunk size for transfers.
        constexpr static std::size_t chunkSize = 32 * 1024;

        SftpSession(std::shared_ptr<std::recursive_mutex> guard, sftp_session session);
        ~SftpSession() override;
        SftpSession(SftpSession const&) = delete;
        SftpSession& operator=(SftpSession const&) = delete;
        SftpSession(SftpSession&&) = delete;
        SftpSession& operator=(SftpSession&&) = delete;

        bool isClosed() const override;
        bool isEof() const override;
        std::expected<FileInformation, SftpError> stat(std::string const& path) override;
        std::expected<std::vector<FileInformation>, SftpError> listDirectory(std::string const& path) override;
        std::expected<void, SftpError> download(std::string const& remotePath, std::ostream& sink) override;
        std::expected<void, SftpError> upload(std::istream& source, std::string const& remotePath) override;
        std::expected<void, SftpError> rename(std::string const& from, std::string const& to) override;
        std::expected<void, SftpError> removeFile(std::string const& path) override;
        std::expected<void, SftpError> createDirectory(std::string const& path) override;
        std::expected<void, SftpError> removeDirectory(std::string const& path) override;
        std::expected<void, SftpError> close() override;

        /**
         * @brief Retrieves the last error that occurred. May contain success.
         */
        SftpError lastError() const;

      private:
        std::shared_ptr<std::recursive_mutex> guard_;
        sftp_session session_;
    };
}
