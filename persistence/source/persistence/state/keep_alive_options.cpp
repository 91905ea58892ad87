#include <persistence/state/keep_alive_options.hpp>

namespace Persistence
{
    void KeepAliveOptions::useDefaultsFrom(KeepAliveOptions const& other)
    {
        if (!enabled)
            enabled = other.enabled;
        if (!intervalMilliseconds)
            intervalMilliseconds = other.intervalMilliseconds;
    }
    void to_json(nlohmann::json& j, KeepAliveOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, enabled);
        TO_JSON_OPTIONAL_RENAME(j, options, intervalMilliseconds, "interval");
    }
    void from_json(nlohmann::json const& j, KeepAliveOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, enabled);
        FROM_JSON_OPTIONAL_RENAME(j, options, intervalMilliseconds, "interval");
    }
}
