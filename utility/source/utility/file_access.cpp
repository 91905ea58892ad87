#include <utility/file_access.hpp>

#include <fstream>
#include <system_error>

namespace Utility
{
    bool isReadableFile(std::filesystem::path const& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return false;
        std::ifstream probe{path, std::ios::binary};
        return probe.is_open();
    }
}
