#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a uniquely named directory below a base directory and removes it (recursively) on destruction.
     */
    class TemporaryDirectory
    {
      public:
        /**
         * @param basePath Directory in which the temporary directory is created. Created if missing.
         * @param removeBase Also try to remove the base directory on destruction (only succeeds when empty).
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBase);
        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBase;
    };
}
