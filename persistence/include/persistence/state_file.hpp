#pragma once

#include <persistence/state/state.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace Persistence
{
    /**
     * @brief Reads the configuration file. Comments are allowed in the file.
     * A missing file is not an error, it yields a default state.
     *
     * @return The state with all sessions resolved against the defaults, or a description of the parse error.
     */
    std::expected<State, std::string> loadState(std::filesystem::path const& path);

    /**
     * @brief Writes the state as indented json, creating parent directories as needed.
     */
    std::expected<void, std::string> saveState(std::filesystem::path const& path, State const& state);
}
