#pragma once

#include <persistence/state_core.hpp>
#include <persistence/defaults.hpp>
#include <persistence/state/transfer_options.hpp>
#include <persistence/state/keep_alive_options.hpp>
#include <persistence/state/host_identity_options.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Everything needed to open and use one sftp connection.
     * Unset optionals fall back to Persistence::Defaults, see the accessors below.
     */
    struct SessionOptions
    {
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::string user{};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::filesystem::path> privateKeyFile{std::nullopt};
        std::optional<std::string> privateKeyPassphrase{std::nullopt};
        std::optional<std::int64_t> connectTimeoutMilliseconds{std::nullopt};
        TransferOptions transferOptions{};
        KeepAliveOptions keepAliveOptions{};
        HostIdentityOptions hostIdentityOptions{};

        void useDefaultsFrom(SessionOptions const& other);

        int effectivePort() const;

        /// Negative timeouts mean "use the default".
        std::chrono::milliseconds effectiveConnectTimeout() const;

        bool strictMode() const;
        OverwritePolicy overwritePolicy() const;
        bool transactional() const;
        bool createDirectoriesAutomatically() const;
        bool keepAliveEnabled() const;
        std::chrono::milliseconds keepAliveInterval() const;
    };
    void to_json(nlohmann::json& j, SessionOptions const& options);
    void from_json(nlohmann::json const& j, SessionOptions& options);
}
