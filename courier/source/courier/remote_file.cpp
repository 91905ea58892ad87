#include <courier/remote_file.hpp>
#include <courier/path_resolver.hpp>

namespace Courier
{
    namespace
    {
        RemoteFileType remoteFileTypeFrom(SecureShell::FileType type)
        {
            switch (type)
            {
                case SecureShell::FileType::Regular:
                    return RemoteFileType::File;
                case SecureShell::FileType::Directory:
                    return RemoteFileType::Folder;
                case SecureShell::FileType::Symlink:
                    return RemoteFileType::Link;
                default:
                    return RemoteFileType::Special;
            }
        }
    }

    RemoteFile::RemoteFile(
        std::string host,
        std::string parent,
        std::string name,
        std::optional<std::uint64_t> size,
        RemoteFileType type)
        : host_{std::move(host)}
        , parent_{std::move(parent)}
        , name_{std::move(name)}
        , size_{size}
        , type_{type}
    {}

    RemoteFile RemoteFile::fromFileInformation(
        std::string host,
        std::string parent,
        std::string name,
        SecureShell::FileInformation const& info)
    {
        return RemoteFile{std::move(host), std::move(parent), std::move(name), info.size, remoteFileTypeFrom(info.type)};
    }

    std::string RemoteFile::fullPath() const
    {
        return PathResolver::join(parent_, name_);
    }
}
