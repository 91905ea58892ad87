#pragma once

#include <courier/error.hpp>
#include <courier/remote_file.hpp>
#include <courier/transfer_engine.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace Courier
{
    /**
     * @brief Folder level and bulk operations built on the TransferEngine primitives.
     */
    class DirectoryEngine
    {
      public:
        explicit DirectoryEngine(TransferEngine& transfers);

        /**
         * @brief Lists the entries of a folder whose name matches wildcard. "." and ".." are never returned.
         *
         * @param remoteFolder Must exist in strict mode.
         * @param wildcard File name pattern, empty means "*". Must not contain '/'.
         */
        std::expected<std::vector<RemoteFile>, Error>
        listFiles(std::string const& remoteFolder, std::string const& wildcard = "*");

        std::expected<void, Error> createFolder(std::string const& remoteFolder);

        /**
         * @brief Deletes the folder and everything in it. Not reversible.
         */
        std::expected<void, Error> deleteFolder(std::string const& remoteFolder);

        /**
         * @brief Deletes matching regular files. Folders and other entries are skipped.
         */
        std::expected<void, Error> deleteFiles(std::string const& remoteFolder, std::string const& wildcard);

        /**
         * @brief Moves every matching entry from sourceFolder/name to destinationFolder/name.
         */
        std::expected<void, Error> moveFiles(
            std::string const& sourceFolder,
            std::string const& destinationFolder,
            std::string const& wildcard);

        /**
         * @brief Uploads local files into remoteFolder, keeping their file names.
         */
        std::expected<void, Error>
        uploadFiles(std::string const& remoteFolder, std::vector<std::filesystem::path> const& localFiles);

        /**
         * @brief Downloads the matching regular files (non recursive) of remoteFolder into localFolder.
         */
        std::expected<void, Error> downloadFiles(
            std::string const& remoteFolder,
            std::filesystem::path const& localFolder,
            std::string const& wildcard = "*");

      private:
        std::expected<void, Error> requireRemoteFolder(std::string const& remoteFolder);

      private:
        TransferEngine* transfers_;
    };
}
