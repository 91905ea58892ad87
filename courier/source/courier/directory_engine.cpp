#include <courier/directory_engine.hpp>
#include <courier/path_resolver.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace Courier
{
    DirectoryEngine::DirectoryEngine(TransferEngine& transfers)
        : transfers_{&transfers}
    {}

    std::expected<void, Error> DirectoryEngine::requireRemoteFolder(std::string const& remoteFolder)
    {
        return transfers_->prepareRemoteFolder(remoteFolder, false);
    }

    std::expected<std::vector<RemoteFile>, Error>
    DirectoryEngine::listFiles(std::string const& remoteFolder, std::string const& wildcard)
    {
        Log::debug("Listing remote files of '{}' with wildcard '{}'", remoteFolder, wildcard);
        if (auto result = requireRemoteFolder(remoteFolder); !result)
            return std::unexpected(result.error());

        const auto pattern = PathResolver::validateWildcard(wildcard);
        if (!pattern)
            return std::unexpected(pattern.error());

        auto& session = transfers_->session();
        auto connection = session.getConnection();
        if (!connection)
            return std::unexpected(connection.error());

        const auto folder = remoteFolder.empty() ? std::string{PathResolver::separator} : remoteFolder;
        auto entries = (*connection)->sftp().listDirectory(folder);
        if (!entries)
        {
            session.noteTransportFailure("Error listing remote files", entries.error());
            return std::unexpected(Error{
                .type = ErrorType::TransferError,
                .message = fmt::format("Error listing remote files of '{}'", folder),
                .sftpError = entries.error(),
            });
        }

        const auto host = session.options().host;
        std::unordered_set<std::string> seen{};
        std::vector<RemoteFile> files{};
        for (auto const& entry : *entries)
        {
            if (entry.name == "." || entry.name == "..")
                continue;
            if (!PathResolver::matchesWildcard(entry.name, *pattern))
                continue;
            if (!seen.insert(entry.name).second)
                continue;
            files.push_back(RemoteFile::fromFileInformation(host, remoteFolder, entry.name, entry));
        }
        return files;
    }

    std::expected<void, Error> DirectoryEngine::createFolder(std::string const& remoteFolder)
    {
        Log::info("Creating remote folder '{}'", remoteFolder);
        return transfers_->createRemoteFolder(remoteFolder);
    }

    std::expected<void, Error> DirectoryEngine::deleteFolder(std::string const& remoteFolder)
    {
        if (auto result = requireRemoteFolder(remoteFolder); !result)
            return result;

        auto children = listFiles(remoteFolder, "*");
        if (!children)
            return std::unexpected(children.error());

        for (auto const& child : *children)
        {
            if (child.isFolder())
            {
                Log::debug("Deleting remote folder: {}", child.fullPath());
                if (auto result = deleteFolder(child.fullPath()); !result)
                    return result;
            }
            else if (auto result = transfers_->deleteRemoteFile(child.fullPath()); !result)
            {
                // links and special files fail the strict file check, remove them directly
                if (result.error().type != ErrorType::NotFound)
                    return result;

                auto connection = transfers_->session().getConnection();
                if (!connection)
                    return std::unexpected(connection.error());
                if (auto removed = (*connection)->sftp().removeFile(child.fullPath()); !removed)
                {
                    transfers_->session().noteTransportFailure("Delete failed", removed.error());
                    return std::unexpected(Error{
                        .type = ErrorType::TransferError,
                        .message = fmt::format("Delete failed: {}", child.fullPath()),
                        .sftpError = removed.error(),
                    });
                }
            }
        }

        auto connection = transfers_->session().getConnection();
        if (!connection)
            return std::unexpected(connection.error());
        if (auto result = (*connection)->sftp().removeDirectory(remoteFolder); !result)
        {
            transfers_->session().noteTransportFailure("Delete failed", result.error());
            return std::unexpected(Error{
                .type = ErrorType::TransferError,
                .message = fmt::format("Delete failed: {}", remoteFolder),
                .sftpError = result.error(),
            });
        }
        return {};
    }

    std::expected<void, Error> DirectoryEngine::deleteFiles(std::string const& remoteFolder, std::string const& wildcard)
    {
        const auto pattern = PathResolver::validateWildcard(wildcard);
        if (!pattern)
            return std::unexpected(pattern.error());

        Log::debug("Deleting remote files in '{}' with wildcard '{}'", remoteFolder, *pattern);
        auto files = listFiles(remoteFolder, *pattern);
        if (!files)
            return std::unexpected(files.error());

        for (auto const& file : *files)
        {
            if (!file.isFile())
                continue;
            if (auto result = transfers_->deleteRemoteFile(file.fullPath()); !result)
                return result;
        }
        return {};
    }

    std::expected<void, Error> DirectoryEngine::moveFiles(
        std::string const& sourceFolder,
        std::string const& destinationFolder,
        std::string const& wildcard)
    {
        const auto pattern = PathResolver::validateWildcard(wildcard);
        if (!pattern)
            return std::unexpected(pattern.error());

        if (auto result = requireRemoteFolder(sourceFolder); !result)
            return result;
        const bool createDirectories = transfers_->session().options().createDirectoriesAutomatically();
        if (auto result = transfers_->prepareRemoteFolder(destinationFolder, createDirectories); !result)
            return result;

        auto files = listFiles(sourceFolder, *pattern);
        if (!files)
            return std::unexpected(files.error());

        Log::info("Moving {} entries from '{}' to '{}'", files->size(), sourceFolder, destinationFolder);
        for (auto const& file : *files)
        {
            if (auto result = transfers_->renameRemoteEntry(
                    PathResolver::join(sourceFolder, file.name()), PathResolver::join(destinationFolder, file.name()));
                !result)
                return result;
        }
        return {};
    }

    std::expected<void, Error>
    DirectoryEngine::uploadFiles(std::string const& remoteFolder, std::vector<std::filesystem::path> const& localFiles)
    {
        const bool createDirectories = transfers_->session().options().createDirectoriesAutomatically();
        if (auto result = transfers_->prepareRemoteFolder(remoteFolder, createDirectories); !result)
            return result;

        for (auto const& localFile : localFiles)
        {
            if (auto result = transfers_->requireLocalFile(localFile); !result)
                return result;
        }

        for (auto const& localFile : localFiles)
        {
            if (auto result =
                    transfers_->uploadFile(PathResolver::join(remoteFolder, localFile.filename().string()), localFile);
                !result)
                return result;
        }
        return {};
    }

    std::expected<void, Error> DirectoryEngine::downloadFiles(
        std::string const& remoteFolder,
        std::filesystem::path const& localFolder,
        std::string const& wildcard)
    {
        Log::info(
            "Downloading remote files from '{}' to '{}' with wildcard '{}'", remoteFolder, localFolder.string(), wildcard);

        const auto pattern = PathResolver::validateWildcard(wildcard);
        if (!pattern)
            return std::unexpected(pattern.error());

        if (auto result = requireRemoteFolder(remoteFolder); !result)
            return result;
        const bool createDirectories = transfers_->session().options().createDirectoriesAutomatically();
        if (auto result = transfers_->prepareLocalFolder(localFolder, createDirectories); !result)
            return result;

        auto files = listFiles(remoteFolder, *pattern);
        if (!files)
            return std::unexpected(files.error());

        for (auto const& file : *files)
        {
            if (!file.isFile())
                continue;
            if (auto result = transfers_->downloadFile(file.fullPath(), localFolder / file.name()); !result)
                return result;
        }
        return {};
    }
}
