#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace SecureShell
{
    enum class FileType : std::uint8_t
    {
        Unknown = 0,
        Regular = 1,
        Directory = 2,
        Symlink = 3,
        Special = 4,
    };

    /**
     * @brief Attributes of a remote directory entry as reported by the server.
     */
    struct FileInformation
    {
        /// File name without directory for listings, the requested path for stat.
        std::string name{};
        FileType type{FileType::Unknown};
        std::optional<std::uint64_t> size{std::nullopt};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        std::uint64_t mtime{0};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
    };
}
