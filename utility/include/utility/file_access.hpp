#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief True if path names a regular file this process can open for reading.
     */
    bool isReadableFile(std::filesystem::path const& path);
}
