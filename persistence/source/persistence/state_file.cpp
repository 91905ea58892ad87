#include <persistence/state_file.hpp>
#include <log/log.hpp>

#include <fstream>

namespace Persistence
{
    std::expected<State, std::string> loadState(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
        {
            Log::warn("Config file '{}' does not exist, using defaults.", path.generic_string());
            return State{};
        }

        try
        {
            const auto json = nlohmann::json::parse(reader, nullptr, true, true);
            if (json.is_null())
                return State{};
            return json.get<State>().fullyResolve();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to parse config file '{}': {}", path.generic_string(), e.what());
            return std::unexpected(std::string{e.what()});
        }
    }

    std::expected<void, std::string> saveState(std::filesystem::path const& path, State const& state)
    {
        std::error_code ec{};
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return std::unexpected(ec.message());

        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
            return std::unexpected("Cannot open '" + path.generic_string() + "' for writing");

        writer << nlohmann::json(state).dump(4);
        if (!writer.good())
            return std::unexpected("Failed to write '" + path.generic_string() + "'");
        return {};
    }
}
