#pragma once

#include <ssh/file_information.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace Courier
{
    enum class RemoteFileType
    {
        File,
        Folder,
        Link,
        Special,
    };

    /**
     * @brief Snapshot of a stat or listing result.
     */
    class RemoteFile
    {
      public:
        RemoteFile(
            std::string host,
            std::string parent,
            std::string name,
            std::optional<std::uint64_t> size,
            RemoteFileType type);

        static RemoteFile
        fromFileInformation(std::string host, std::string parent, std::string name, SecureShell::FileInformation const& info);

        std::string const& host() const
        {
            return host_;
        }
        std::string const& parent() const
        {
            return parent_;
        }
        std::string const& name() const
        {
            return name_;
        }
        std::optional<std::uint64_t> size() const
        {
            return size_;
        }
        RemoteFileType type() const
        {
            return type_;
        }
        bool isFile() const
        {
            return type_ == RemoteFileType::File;
        }
        bool isFolder() const
        {
            return type_ == RemoteFileType::Folder;
        }

        /**
         * @brief Parent and name joined by a single '/'.
         */
        std::string fullPath() const;

      private:
        std::string host_;
        std::string parent_;
        std::string name_;
        std::optional<std::uint64_t> size_;
        RemoteFileType type_;
    };
}
