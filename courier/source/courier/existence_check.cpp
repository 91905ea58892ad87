#include <courier/existence_check.hpp>
#include <courier/transport_session.hpp>

#include <filesystem>
#include <system_error>

namespace Courier
{
    bool LocalExistenceCheck::exists(std::string const& name)
    {
        std::error_code ec;
        return std::filesystem::exists(name, ec);
    }

    RemoteExistenceCheck::RemoteExistenceCheck(TransportSession& session)
        : session_{&session}
    {}

    bool RemoteExistenceCheck::exists(std::string const& name)
    {
        auto connection = session_->getConnection();
        if (!connection)
            return false;
        return (*connection)->sftp().stat(name).has_value();
    }
}
