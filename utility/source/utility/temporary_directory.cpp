#include <utility/temporary_directory.hpp>
#include <utility/random_string.hpp>

#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBase)
        : m_basePath{std::move(basePath)}
        , m_path{}
        , m_removeBase{removeBase}
    {
        if (!std::filesystem::exists(m_basePath))
            std::filesystem::create_directories(m_basePath);

        int i = 0;
        for (; i != 1000; ++i)
        {
            const auto path = m_basePath / ("dir"s + randomAlphanumeric(10));
            std::error_code ec{};
            // create_directory returns false if it already existed.
            if (std::filesystem::create_directory(path, ec) && !ec)
            {
                m_path = path;
                break;
            }
        }
        if (i == 1000)
            throw std::runtime_error("Could not setup temporary directory in: "s + m_basePath.string());
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "sftp_courier_tmpdir", true}
    {}

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBase)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
