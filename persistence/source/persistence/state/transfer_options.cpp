#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    std::string overwritePolicyToString(OverwritePolicy policy)
    {
        return nlohmann::json(policy).get<std::string>();
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        if (!strictMode)
            strictMode = other.strictMode;
        if (!overwritePolicy)
            overwritePolicy = other.overwritePolicy;
        if (!transactional)
            transactional = other.transactional;
        if (!createDirectoriesAutomatically)
            createDirectoriesAutomatically = other.createDirectoriesAutomatically;
    }
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, strictMode);
        TO_JSON_OPTIONAL(j, options, overwritePolicy);
        TO_JSON_OPTIONAL(j, options, transactional);
        TO_JSON_OPTIONAL(j, options, createDirectoriesAutomatically);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, strictMode);
        FROM_JSON_OPTIONAL(j, options, overwritePolicy);
        FROM_JSON_OPTIONAL(j, options, transactional);
        FROM_JSON_OPTIONAL(j, options, createDirectoriesAutomatically);
    }
}
