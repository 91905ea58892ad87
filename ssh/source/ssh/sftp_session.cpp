#include <ssh/sftp_session.hpp>

#include <fmt/format.h>

#include <fcntl.h>

#include <functional>

namespace SecureShell
{
    namespace
    {
        FileType fileTypeFromSftp(std::uint8_t type)
        {
            switch (type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return FileType::Regular;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return FileType::Symlink;
                case SSH_FILEXFER_TYPE_SPECIAL:
                    return FileType::Special;
                default:
                    return FileType::Unknown;
            }
        }

        FileInformation fromSftpAttributes(sftp_attributes attributes, std::string name)
        {
            return FileInformation{
                .name = std::move(name),
                .type = fileTypeFromSftp(attributes->type),
                .size = (attributes->flags & SSH_FILEXFER_ATTR_SIZE) ? std::optional<std::uint64_t>{attributes->size}
                                                                     : std::nullopt,
                .permissions = static_cast<std::filesystem::perms>(attributes->permissions) &
                    std::filesystem::perms::mask,
                .mtime = attributes->mtime,
            };
        }

        using SftpFilePointer = std::unique_ptr<sftp_file_struct, std::function<void(sftp_file)>>;
    }

    SftpSession::SftpSession(std::shared_ptr<std::recursive_mutex> guard, sftp_session session)
        : guard_{std::move(guard)}
        , session_{session}
    {}

    SftpSession::~SftpSession()
    {
        std::scoped_lock lock{*guard_};
        if (session_ != nullptr)
            sftp_free(session_);
    }

    bool SftpSession::isClosed() const
    {
        std::scoped_lock lock{*guard_};
        return session_ == nullptr || session_->channel == nullptr || ssh_channel_is_closed(session_->channel) != 0;
    }

    bool SftpSession::isEof() const
    {
        std::scoped_lock lock{*guard_};
        return session_ == nullptr || session_->channel == nullptr || ssh_channel_is_eof(session_->channel) != 0;
    }

    std::expected<FileInformation, SftpError> SftpSession::stat(std::string const& path)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});

        std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
            sftp_stat(session_, path.c_str()), sftp_attributes_free};
        if (attributes == nullptr)
            return std::unexpected(lastError());

        return fromSftpAttributes(attributes.get(), path);
    }

    std::expected<std::vector<FileInformation>, SftpError> SftpSession::listDirectory(std::string const& path)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});

        int closeResult = 0;
        std::vector<FileInformation> entries{};

        {
            std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                sftp_opendir(session_, path.c_str()), [&](sftp_dir_struct* dir) {
                    if (dir != nullptr)
                        closeResult = sftp_closedir(dir);
                }};
            if (dir == nullptr)
                return std::unexpected(lastError());

            {
                std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                    sftp_readdir(session_, dir.get()), sftp_attributes_free};

                for (; entry != nullptr; entry.reset(sftp_readdir(session_, dir.get())))
                {
                    entries.push_back(
                        fromSftpAttributes(entry.get(), entry->name ? std::string{entry->name} : std::string{}));
                }
            }

            if (!sftp_dir_eof(dir.get()))
                return std::unexpected(lastError());
        }
        if (closeResult != SSH_OK)
        {
            auto error = lastError();
            error.sshError = closeResult;
            return std::unexpected(std::move(error));
        }

        return entries;
    }

    std::expected<void, SftpError> SftpSession::download(std::string const& remotePath, std::ostream& sink)
    {
        SftpFilePointer file{nullptr, [this](sftp_file file) {
                                 std::scoped_lock lock{*guard_};
                                 sftp_close(file);
                             }};
        {
            std::scoped_lock lock{*guard_};
            if (session_ == nullptr)
                return std::unexpected(SftpError{.message = "Sftp session is closed"});
            file.reset(sftp_open(session_, remotePath.c_str(), O_RDONLY, 0));
            if (!file)
                return std::unexpected(lastError());
        }

        std::string buffer(chunkSize, '\0');
        while (true)
        {
            ssize_t amount = 0;
            {
                // released between chunks so keep alive pings can interleave
                std::scoped_lock lock{*guard_};
                amount = sftp_read(file.get(), buffer.data(), buffer.size());
                if (amount < 0)
                    return std::unexpected(lastError());
            }
            if (amount == 0)
                break;

            sink.write(buffer.data(), amount);
            if (!sink)
                return std::unexpected(
                    SftpError{.message = fmt::format("Failed to write local data of '{}'", remotePath)});
        }
        return {};
    }

    std::expected<void, SftpError> SftpSession::upload(std::istream& source, std::string const& remotePath)
    {
        SftpFilePointer file{nullptr, [this](sftp_file file) {
                                 std::scoped_lock lock{*guard_};
                                 sftp_close(file);
                             }};
        {
            std::scoped_lock lock{*guard_};
            if (session_ == nullptr)
                return std::unexpected(SftpError{.message = "Sftp session is closed"});
            file.reset(sftp_open(
                session_,
                remotePath.c_str(),
                O_WRONLY | O_CREAT | O_TRUNC,
                static_cast<mode_t>(
                    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                    std::filesystem::perms::group_read | std::filesystem::perms::others_read)));
            if (!file)
                return std::unexpected(lastError());
        }

        std::string buffer(chunkSize, '\0');
        while (source)
        {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto amount = static_cast<std::size_t>(source.gcount());
            if (amount == 0)
                break;

            std::size_t offset = 0;
            while (offset < amount)
            {
                std::scoped_lock lock{*guard_};
                const auto written = sftp_write(file.get(), buffer.data() + offset, amount - offset);
                if (written < 0)
                    return std::unexpected(lastError());
                if (written == 0)
                    return std::unexpected(
                        SftpError{.message = fmt::format("Failed to write any data to '{}'", remotePath)});
                offset += static_cast<std::size_t>(written);
            }
        }
        if (source.bad())
            return std::unexpected(SftpError{.message = fmt::format("Failed to read local data for '{}'", remotePath)});

        std::scoped_lock lock{*guard_};
        if (sftp_close(file.release()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> SftpSession::rename(std::string const& from, std::string const& to)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});

        // sftp_rename uses posix-rename@openssh.com when the server offers it, which replaces the target
        if (sftp_rename(session_, from.c_str(), to.c_str()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> SftpSession::removeFile(std::string const& path)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});
        if (sftp_unlink(session_, path.c_str()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> SftpSession::createDirectory(std::string const& path)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});

        const auto permissions = std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
            std::filesystem::perms::others_exec;
        if (sftp_mkdir(session_, path.c_str(), static_cast<mode_t>(permissions)) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> SftpSession::removeDirectory(std::string const& path)
    {
        std::scoped_lock lock{*guard_};
        if (session_ == nullptr)
            return std::unexpected(SftpError{.message = "Sftp session is closed"});
        if (sftp_rmdir(session_, path.c_str()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> SftpSession::close()
    {
        std::scoped_lock lock{*guard_};
        if (session_ != nullptr)
        {
            sftp_free(session_);
            session_ = nullptr;
        }
        return {};
    }

    SftpError SftpSession::lastError() const
    {
        if (session_ == nullptr)
            return SftpError{.message = "Sftp session is closed"};
        return SftpError{
            .message = ssh_get_error(session_->session),
            .sshError = ssh_get_error_code(session_->session),
            .sftpError = sftp_get_error(session_),
        };
    }
}
