#pragma once

#include <log/level.hpp>
#include <persistence/state_core.hpp>
#include <persistence/state/session_options.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace Persistence
{
    struct State
    {
        /// Values every named session falls back to.
        SessionOptions defaults{};
        std::unordered_map<std::string, SessionOptions> sessions{};
        Log::Level logLevel{Log::Level::Info};
        std::optional<std::filesystem::path> logFile{std::nullopt};

        /**
         * @brief Returns a copy in which every session has its gaps filled from the defaults.
         */
        State fullyResolve() const;
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
