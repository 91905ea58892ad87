#include <courier/transfer_engine.hpp>
#include <courier/existence_check.hpp>
#include <courier/path_resolver.hpp>
#include <log/log.hpp>
#include <utility/file_access.hpp>
#include <utility/random_string.hpp>

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <stack>
#include <system_error>

namespace Courier
{
    namespace
    {
        // parentOf("/a") is the root, which sftp only understands as "/"
        std::string folderPath(std::string const& folder)
        {
            return folder.empty() ? std::string{PathResolver::separator} : folder;
        }

        std::string temporaryNameFor(std::string const& path)
        {
            return PathResolver::directoryPrefixOf(path) + "." +
                Utility::randomAlphanumeric(TransferEngine::temporaryNameLength);
        }
    }

    TransferEngine::TransferEngine(TransportSession& session, std::shared_ptr<EventSink> events)
        : session_{&session}
        , events_{std::move(events)}
    {}

    Error TransferEngine::transferError(std::string const& context, SecureShell::SftpError const& cause)
    {
        session_->noteTransportFailure(context, cause);
        return Error{.type = ErrorType::TransferError, .message = context, .sftpError = cause};
    }

    std::expected<void, Error> TransferEngine::failTransfer(std::string const& target, Error error)
    {
        events_->onTransferState(target, TransferState::Failed);
        return std::unexpected(std::move(error));
    }

    // ------------------------------------------------------------------------------------------
    // Preconditions
    // ------------------------------------------------------------------------------------------

    std::expected<void, Error>
    TransferEngine::prepareRemoteFolder(std::string const& remoteFolder, bool createIfMissing)
    {
        const bool strict = session_->options().strictMode();
        if (!createIfMissing && !strict)
            return {};

        auto folder = statRemoteFile(folderPath(remoteFolder));
        if (!folder)
            return std::unexpected(folder.error());

        if (!folder->has_value())
        {
            if (createIfMissing)
                return createRemoteFolder(remoteFolder);
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Remote folder not found: {}", folderPath(remoteFolder)),
            });
        }

        if (strict && !(*folder)->isFolder())
        {
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Remote folder not found or not a valid folder: {}", folderPath(remoteFolder)),
            });
        }
        return {};
    }

    std::expected<void, Error> TransferEngine::requireRemoteFile(std::string const& remotePath)
    {
        if (!session_->options().strictMode())
            return {};

        auto file = statRemoteFile(remotePath);
        if (!file)
            return std::unexpected(file.error());
        if (!file->has_value() || !(*file)->isFile())
        {
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Remote file not found or not a valid file: {}", remotePath),
            });
        }
        return {};
    }

    std::expected<void, Error>
    TransferEngine::prepareLocalFolder(std::filesystem::path const& localFolder, bool createIfMissing)
    {
        const auto folder = localFolder.empty() ? std::filesystem::path{"."} : localFolder;

        std::error_code ec;
        if (std::filesystem::is_directory(folder, ec))
            return {};

        if (createIfMissing)
        {
            Log::debug("Creating local folder: {}", folder.string());
            std::filesystem::create_directories(folder, ec);
            if (ec)
            {
                return std::unexpected(Error{
                    .type = ErrorType::NotFound,
                    .message = fmt::format("Cannot create local folder '{}': {}", folder.string(), ec.message()),
                });
            }
            return {};
        }

        if (session_->options().strictMode())
        {
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Cannot find local folder: {}", folder.string()),
            });
        }
        return {};
    }

    std::expected<void, Error> TransferEngine::requireLocalFile(std::filesystem::path const& localPath)
    {
        if (session_->options().strictMode() && !Utility::isReadableFile(localPath))
        {
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Cannot read local file: {}", localPath.string()),
            });
        }
        return {};
    }

    // ------------------------------------------------------------------------------------------
    // Upload
    // ------------------------------------------------------------------------------------------

    std::expected<void, Error>
    TransferEngine::uploadFile(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        if (auto result = requireLocalFile(localPath); !result)
            return result;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(localPath, ec))
        {
            return std::unexpected(Error{
                .type = ErrorType::InvalidInput,
                .message = fmt::format("{} is not a valid local file (may be a folder?)", localPath.string()),
            });
        }

        std::ifstream source{localPath, std::ios::binary};
        if (!source.is_open())
        {
            return std::unexpected(Error{
                .type = ErrorType::NotFound,
                .message = fmt::format("Cannot open local file: {}", localPath.string()),
            });
        }

        Log::info("Uploading file '{}' to '{}'", localPath.string(), remotePath);
        return uploadInternal(remotePath, source);
    }

    std::expected<void, Error> TransferEngine::uploadStream(std::string const& remotePath, std::istream& source)
    {
        Log::info("Uploading input stream to '{}'", remotePath);
        return uploadInternal(remotePath, source);
    }

    std::expected<void, Error> TransferEngine::uploadData(std::string const& remotePath, std::string const& data)
    {
        Log::info("Uploading {} bytes of data to '{}'", data.size(), remotePath);
        std::istringstream source{data};
        return uploadInternal(remotePath, source);
    }

    std::expected<void, Error> TransferEngine::uploadInternal(std::string const& remotePath, std::istream& source)
    {
        events_->onTransferState(remotePath, TransferState::Validating);

        const auto options = session_->options();
        if (const auto parent = PathResolver::parentOf(remotePath); parent)
        {
            if (auto result = prepareRemoteFolder(*parent, options.createDirectoriesAutomatically()); !result)
                return failTransfer(remotePath, result.error());
        }

        ConflictResolver resolver{options.overwritePolicy(), events_};
        RemoteExistenceCheck check{*session_};

        auto finalName = resolver.resolve(remotePath, check);
        if (!finalName)
            return failTransfer(remotePath, finalName.error());

        // the existence checks may have replaced the connection
        auto connection = session_->getConnection();
        if (!connection)
            return failTransfer(remotePath, connection.error());
        auto& sftp = (*connection)->sftp();

        if (!options.transactional())
        {
            events_->onTransferState(remotePath, TransferState::TransferringDirect);
            if (auto result = sftp.upload(source, *finalName); !result)
                return failTransfer(
                    remotePath, transferError(fmt::format("Upload failed: {}", *finalName), result.error()));

            events_->onTransferState(remotePath, TransferState::Done);
            return {};
        }

        const auto temporaryName = temporaryNameFor(*finalName);
        Log::debug("Uploading to temporary file: {}", temporaryName);
        events_->onTransferState(remotePath, TransferState::TransferringTemp);
        if (auto result = sftp.upload(source, temporaryName); !result)
        {
            auto error = transferError(fmt::format("Upload failed: {}", remotePath), result.error());
            removeRemoteTemporary(temporaryName);
            return failTransfer(remotePath, std::move(error));
        }

        // the destination may have been created by someone else while uploading
        finalName = resolver.resolve(remotePath, check);
        if (!finalName)
        {
            removeRemoteTemporary(temporaryName);
            return failTransfer(remotePath, finalName.error());
        }

        connection = session_->getConnection();
        if (!connection)
        {
            removeRemoteTemporary(temporaryName);
            return failTransfer(remotePath, connection.error());
        }

        events_->onTransferState(remotePath, TransferState::Renaming);
        if (auto result = (*connection)->sftp().rename(temporaryName, *finalName); !result)
        {
            auto error = transferError(
                fmt::format("Rename of '{}' to '{}' failed", temporaryName, *finalName), result.error());
            removeRemoteTemporary(temporaryName);
            return failTransfer(remotePath, std::move(error));
        }

        events_->onTransferState(remotePath, TransferState::Done);
        return {};
    }

    void TransferEngine::removeRemoteTemporary(std::string const& temporaryPath)
    {
        auto connection = session_->getConnection();
        if (!connection)
        {
            Log::warn("Cannot remove temporary file '{}': {}", temporaryPath, connection.error().toString());
            return;
        }
        if (auto result = (*connection)->sftp().removeFile(temporaryPath); !result && !result.error().isNoSuchFile())
            Log::warn("Cannot remove temporary file '{}': {}", temporaryPath, result.error().toString());
    }

    // ------------------------------------------------------------------------------------------
    // Download
    // ------------------------------------------------------------------------------------------

    std::expected<void, Error>
    TransferEngine::downloadFile(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        Log::info("Downloading remote file '{}' to '{}'", remotePath, localPath.string());
        if (auto result = requireRemoteFile(remotePath); !result)
            return result;
        return downloadInternal(remotePath, localPath);
    }

    std::expected<void, Error> TransferEngine::downloadStream(std::string const& remotePath, std::ostream& sink)
    {
        Log::info("Downloading remote file '{}' to local stream", remotePath);
        events_->onTransferState(remotePath, TransferState::Validating);
        if (auto result = requireRemoteFile(remotePath); !result)
            return failTransfer(remotePath, result.error());

        auto connection = session_->getConnection();
        if (!connection)
            return failTransfer(remotePath, connection.error());

        events_->onTransferState(remotePath, TransferState::TransferringDirect);
        if (auto result = (*connection)->sftp().download(remotePath, sink); !result)
            return failTransfer(
                remotePath, transferError(fmt::format("Download failed: {}", remotePath), result.error()));

        events_->onTransferState(remotePath, TransferState::Done);
        return {};
    }

    std::expected<std::string, Error> TransferEngine::downloadData(std::string const& remotePath)
    {
        std::ostringstream sink{};
        if (auto result = downloadStream(remotePath, sink); !result)
            return std::unexpected(result.error());
        return std::move(sink).str();
    }

    std::expected<void, Error>
    TransferEngine::downloadInternal(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        const auto target = localPath.generic_string();
        events_->onTransferState(target, TransferState::Validating);

        const auto options = session_->options();
        if (auto result = prepareLocalFolder(localPath.parent_path(), options.createDirectoriesAutomatically());
            !result)
            return failTransfer(target, result.error());

        ConflictResolver resolver{options.overwritePolicy(), events_};
        LocalExistenceCheck check{};

        auto finalName = resolver.resolve(target, check);
        if (!finalName)
            return failTransfer(target, finalName.error());

        auto connection = session_->getConnection();
        if (!connection)
            return failTransfer(target, connection.error());
        auto& sftp = (*connection)->sftp();

        const auto downloadTo = [&](std::filesystem::path const& path) -> std::expected<void, Error> {
            std::ofstream sink{path, std::ios::binary | std::ios::trunc};
            if (!sink.is_open())
            {
                return std::unexpected(Error{
                    .type = ErrorType::NotFound,
                    .message = fmt::format("Cannot open local file for writing: {}", path.string()),
                });
            }
            if (auto result = sftp.download(remotePath, sink); !result)
                return std::unexpected(transferError(fmt::format("Download failed: {}", remotePath), result.error()));
            sink.close();
            if (!sink)
            {
                return std::unexpected(Error{
                    .type = ErrorType::TransferError,
                    .message = fmt::format("Failed to write local file: {}", path.string()),
                });
            }
            return {};
        };

        if (!options.transactional())
        {
            events_->onTransferState(target, TransferState::TransferringDirect);
            if (auto result = downloadTo(*finalName); !result)
                return failTransfer(target, result.error());
            events_->onTransferState(target, TransferState::Done);
            return {};
        }

        const std::filesystem::path temporaryName = temporaryNameFor(*finalName);
        const auto removeTemporary = [&temporaryName]() {
            std::error_code ec;
            std::filesystem::remove(temporaryName, ec);
            if (ec)
                Log::warn("Cannot remove temporary file '{}': {}", temporaryName.string(), ec.message());
        };

        Log::debug("Downloading to temporary file: {}", temporaryName.string());
        events_->onTransferState(target, TransferState::TransferringTemp);
        if (auto result = downloadTo(temporaryName); !result)
        {
            removeTemporary();
            return failTransfer(target, result.error());
        }

        // the destination may have been created by someone else while downloading
        finalName = resolver.resolve(target, check);
        if (!finalName)
        {
            removeTemporary();
            return failTransfer(target, finalName.error());
        }

        events_->onTransferState(target, TransferState::Renaming);
        std::error_code ec;
        std::filesystem::rename(temporaryName, *finalName, ec);
        if (ec)
        {
            removeTemporary();
            return failTransfer(
                target,
                Error{
                    .type = ErrorType::TransferError,
                    .message = fmt::format(
                        "Rename of '{}' to '{}' failed: {}", temporaryName.string(), *finalName, ec.message()),
                });
        }

        events_->onTransferState(target, TransferState::Done);
        return {};
    }

    // ------------------------------------------------------------------------------------------
    // File primitives
    // ------------------------------------------------------------------------------------------

    std::expected<void, Error> TransferEngine::renameRemoteFile(std::string const& oldPath, std::string const& newPath)
    {
        if (auto result = requireRemoteFile(oldPath); !result)
            return result;
        return renameRemoteEntry(oldPath, newPath);
    }

    std::expected<void, Error> TransferEngine::renameRemoteEntry(std::string const& oldPath, std::string const& newPath)
    {
        if (const auto parent = PathResolver::parentOf(newPath); parent)
        {
            if (auto result = prepareRemoteFolder(*parent, session_->options().createDirectoriesAutomatically());
                !result)
                return result;
        }

        auto connection = session_->getConnection();
        if (!connection)
            return std::unexpected(connection.error());

        Log::debug("Renaming '{}' to '{}'", oldPath, newPath);
        if (auto result = (*connection)->sftp().rename(oldPath, newPath); !result)
            return std::unexpected(transferError("Rename failed", result.error()));
        return {};
    }

    std::expected<void, Error> TransferEngine::deleteRemoteFile(std::string const& remotePath)
    {
        if (auto result = requireRemoteFile(remotePath); !result)
            return result;

        auto connection = session_->getConnection();
        if (!connection)
            return std::unexpected(connection.error());

        Log::debug("Deleting remote file: {}", remotePath);
        if (auto result = (*connection)->sftp().removeFile(remotePath); !result)
            return std::unexpected(transferError(fmt::format("Delete failed: {}", remotePath), result.error()));
        return {};
    }

    std::expected<std::optional<RemoteFile>, Error> TransferEngine::statRemoteFile(std::string const& remotePath)
    {
        auto connection = session_->getConnection();
        if (!connection)
            return std::unexpected(connection.error());

        auto info = (*connection)->sftp().stat(remotePath);
        if (!info)
        {
            if (!info.error().isNoSuchFile())
                Log::debug("Stat of '{}' failed: {}", remotePath, info.error().toString());
            return std::optional<RemoteFile>{};
        }

        return RemoteFile::fromFileInformation(
            session_->options().host,
            PathResolver::parentOf(remotePath).value_or("."),
            PathResolver::fileNameOf(remotePath),
            *info);
    }

    std::expected<bool, Error> TransferEngine::remoteFileExists(std::string const& remotePath)
    {
        auto file = statRemoteFile(remotePath);
        if (!file)
            return std::unexpected(file.error());
        return file->has_value();
    }

    std::expected<void, Error> TransferEngine::createRemoteFolder(std::string const& remoteFolder)
    {
        std::stack<std::string> missing{};
        std::optional<std::string> current = remoteFolder;
        while (current && !current->empty())
        {
            auto exists = remoteFileExists(*current);
            if (!exists)
                return std::unexpected(exists.error());
            if (*exists)
                break;
            missing.push(*current);
            current = PathResolver::parentOf(*current);
        }

        while (!missing.empty())
        {
            auto connection = session_->getConnection();
            if (!connection)
                return std::unexpected(connection.error());

            const auto& folder = missing.top();
            Log::debug("Creating remote folder: {}", folder);
            if (auto result = (*connection)->sftp().createDirectory(folder); !result)
            {
                return std::unexpected(
                    transferError(fmt::format("Creating remote folder failed: {}", remoteFolder), result.error()));
            }
            missing.pop();
        }
        return {};
    }
}
