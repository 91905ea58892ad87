#pragma once

#include <ssh/session_interface.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace SecureShell
{
    struct SessionParameters
    {
        std::string host{};
        int port{22};
        std::string user{};
        std::chrono::milliseconds connectTimeout{30'000};
    };

    /**
     * @brief Factory for sessions of one ssh implementation.
     */
    class ITransport
    {
      public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(ITransport const&) = delete;
        ITransport& operator=(ITransport const&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        virtual std::expected<std::unique_ptr<ISession>, SftpError>
        createSession(SessionParameters const& parameters) = 0;
    };
}
