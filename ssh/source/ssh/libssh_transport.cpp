#include <ssh/libssh_transport.hpp>
#include <ssh/session.hpp>

namespace SecureShell
{
    std::expected<std::unique_ptr<ISession>, SftpError>
    LibsshTransport::createSession(SessionParameters const& parameters)
    {
        auto session = Session::create(parameters);
        if (!session)
            return std::unexpected(session.error());
        return std::unique_ptr<ISession>{std::move(session).value()};
    }
}
