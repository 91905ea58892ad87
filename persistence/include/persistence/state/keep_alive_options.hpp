#pragma once

#include <persistence/state_core.hpp>

#include <cstdint>
#include <optional>

namespace Persistence
{
    struct KeepAliveOptions
    {
        std::optional<bool> enabled{std::nullopt};
        std::optional<std::int64_t> intervalMilliseconds{std::nullopt};

        void useDefaultsFrom(KeepAliveOptions const& other);
    };
    void to_json(nlohmann::json& j, KeepAliveOptions const& options);
    void from_json(nlohmann::json const& j, KeepAliveOptions& options);
}
