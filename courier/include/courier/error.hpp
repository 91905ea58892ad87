#pragma once

#include <ssh/sftp_error.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

namespace Courier
{
    enum class ErrorType
    {
        /// Bad or missing credentials, unreadable key material, bad host identity settings.
        ConfigurationError,
        /// Any transport failure while connecting or reconnecting.
        ConnectionError,
        /// A strict mode existence check failed.
        NotFound,
        /// Destination exists and the overwrite policy is never.
        AlreadyExists,
        /// Connection affecting configuration changed while connected.
        StateError,
        InvalidInput,
        /// A transport operation failed on an established connection.
        TransferError,
    };

    constexpr std::string_view errorTypeToString(ErrorType type)
    {
        switch (type)
        {
            case ErrorType::ConfigurationError:
                return "ConfigurationError";
            case ErrorType::ConnectionError:
                return "ConnectionError";
            case ErrorType::NotFound:
                return "NotFound";
            case ErrorType::AlreadyExists:
                return "AlreadyExists";
            case ErrorType::StateError:
                return "StateError";
            case ErrorType::InvalidInput:
                return "InvalidInput";
            case ErrorType::TransferError:
                return "TransferError";
        }
        return "INVALID_ENUM_VALUE";
    }

    struct Error
    {
        ErrorType type;
        std::string message{};
        std::optional<SecureShell::SftpError> sftpError = std::nullopt;

        std::string toString() const
        {
            if (sftpError.has_value())
                return fmt::format("{}: {}. {}.", errorTypeToString(type), message, sftpError->toString());
            return fmt::format("{}: {}.", errorTypeToString(type), message);
        }
    };
}
