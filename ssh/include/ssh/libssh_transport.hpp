#pragma once

#include <ssh/transport_interface.hpp>

namespace SecureShell
{
    class LibsshTransport : public ITransport
    {
      public:
        LibsshTransport() = default;

        std::expected<std::unique_ptr<ISession>, SftpError> createSession(SessionParameters const& parameters) override;
    };
}
