#include <persistence/state/host_identity_options.hpp>

namespace Persistence
{
    void HostIdentityOptions::useDefaultsFrom(HostIdentityOptions const& other)
    {
        if (!disableCheck)
            disableCheck = other.disableCheck;
        if (!hostKey)
        {
            hostKey = other.hostKey;
            hostKeyType = other.hostKeyType;
        }
        if (!knownHostsFile)
            knownHostsFile = other.knownHostsFile;
    }
    void to_json(nlohmann::json& j, HostIdentityOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, disableCheck);
        TO_JSON_OPTIONAL(j, options, hostKey);
        TO_JSON_OPTIONAL(j, options, hostKeyType);
        TO_JSON_OPTIONAL(j, options, knownHostsFile);
    }
    void from_json(nlohmann::json const& j, HostIdentityOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, disableCheck);
        FROM_JSON_OPTIONAL(j, options, hostKey);
        FROM_JSON_OPTIONAL(j, options, hostKeyType);
        FROM_JSON_OPTIONAL(j, options, knownHostsFile);
    }
}
