#include <persistence/state/session_options.hpp>

namespace Persistence
{
    void SessionOptions::useDefaultsFrom(SessionOptions const& other)
    {
        if (host.empty())
            host = other.host;
        if (!port)
            port = other.port;
        if (user.empty())
            user = other.user;
        // Credentials are taken as a unit, mixing a password with a foreign key would be surprising.
        if (!password && !privateKeyFile)
        {
            password = other.password;
            privateKeyFile = other.privateKeyFile;
            privateKeyPassphrase = other.privateKeyPassphrase;
        }
        if (!connectTimeoutMilliseconds)
            connectTimeoutMilliseconds = other.connectTimeoutMilliseconds;

        transferOptions.useDefaultsFrom(other.transferOptions);
        keepAliveOptions.useDefaultsFrom(other.keepAliveOptions);
        hostIdentityOptions.useDefaultsFrom(other.hostIdentityOptions);
    }

    int SessionOptions::effectivePort() const
    {
        return port.value_or(Defaults::port);
    }

    std::chrono::milliseconds SessionOptions::effectiveConnectTimeout() const
    {
        if (!connectTimeoutMilliseconds || *connectTimeoutMilliseconds < 0)
            return Defaults::connectTimeout;
        return std::chrono::milliseconds{*connectTimeoutMilliseconds};
    }

    bool SessionOptions::strictMode() const
    {
        return transferOptions.strictMode.value_or(Defaults::strictMode);
    }

    OverwritePolicy SessionOptions::overwritePolicy() const
    {
        return transferOptions.overwritePolicy.value_or(OverwritePolicy::Never);
    }

    bool SessionOptions::transactional() const
    {
        return transferOptions.transactional.value_or(Defaults::transactional);
    }

    bool SessionOptions::createDirectoriesAutomatically() const
    {
        return transferOptions.createDirectoriesAutomatically.value_or(Defaults::createDirectoriesAutomatically);
    }

    bool SessionOptions::keepAliveEnabled() const
    {
        return keepAliveOptions.enabled.value_or(Defaults::keepAlive);
    }

    std::chrono::milliseconds SessionOptions::keepAliveInterval() const
    {
        if (!keepAliveOptions.intervalMilliseconds || *keepAliveOptions.intervalMilliseconds < 0)
            return Defaults::keepAliveInterval;
        return std::chrono::milliseconds{*keepAliveOptions.intervalMilliseconds};
    }

    void to_json(nlohmann::json& j, SessionOptions const& options)
    {
        j = {{"host", options.host}, {"user", options.user}};

        TO_JSON_OPTIONAL(j, options, port);
        TO_JSON_OPTIONAL(j, options, password);
        TO_JSON_OPTIONAL(j, options, privateKeyFile);
        TO_JSON_OPTIONAL(j, options, privateKeyPassphrase);
        TO_JSON_OPTIONAL_RENAME(j, options, connectTimeoutMilliseconds, "connectTimeout");
        j["transferOptions"] = options.transferOptions;
        j["keepAliveOptions"] = options.keepAliveOptions;
        j["hostIdentityOptions"] = options.hostIdentityOptions;
    }
    void from_json(nlohmann::json const& j, SessionOptions& options)
    {
        options = {};

        if (j.contains("host"))
            j.at("host").get_to(options.host);
        if (j.contains("user"))
            j.at("user").get_to(options.user);
        FROM_JSON_OPTIONAL(j, options, port);
        FROM_JSON_OPTIONAL(j, options, password);
        FROM_JSON_OPTIONAL(j, options, privateKeyFile);
        FROM_JSON_OPTIONAL(j, options, privateKeyPassphrase);
        FROM_JSON_OPTIONAL_RENAME(j, options, connectTimeoutMilliseconds, "connectTimeout");
        if (j.contains("transferOptions"))
            j.at("transferOptions").get_to(options.transferOptions);
        if (j.contains("keepAliveOptions"))
            j.at("keepAliveOptions").get_to(options.keepAliveOptions);
        if (j.contains("hostIdentityOptions"))
            j.at("hostIdentityOptions").get_to(options.hostIdentityOptions);
    }
}
