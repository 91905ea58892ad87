#pragma once

#include <persistence/state_core.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief What happens when the destination of a transfer already exists.
     */
    enum class OverwritePolicy
    {
        /// Fail with an AlreadyExists error.
        Never,
        /// Replace the existing file.
        Always,
        /// 'file.txt' becomes 'file.1.txt', 'file.2.txt', ...
        AddSuffixBeforeExtension,
        /// 'file.txt' becomes 'file.txt.1', 'file.txt.2', ...
        AddSuffixAfterExtension,
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(
        OverwritePolicy,
        {
            {OverwritePolicy::Never, "never"},
            {OverwritePolicy::Always, "always"},
            {OverwritePolicy::AddSuffixBeforeExtension, "addSuffixBeforeExtension"},
            {OverwritePolicy::AddSuffixAfterExtension, "addSuffixAfterExtension"},
        })

    std::string overwritePolicyToString(OverwritePolicy policy);

    struct TransferOptions
    {
        std::optional<bool> strictMode{std::nullopt};
        std::optional<OverwritePolicy> overwritePolicy{std::nullopt};
        std::optional<bool> transactional{std::nullopt};
        std::optional<bool> createDirectoriesAutomatically{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
