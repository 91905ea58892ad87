#include <persistence/state/state.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["defaults"] = state.defaults;
        j["sessions"] = state.sessions;
        j["logLevel"] = Log::levelToString(state.logLevel);
        TO_JSON_OPTIONAL(j, state, logFile);
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("defaults"))
            j.at("defaults").get_to(state.defaults);

        if (j.contains("sessions"))
            j.at("sessions").get_to(state.sessions);

        if (j.contains("logLevel"))
            state.logLevel = Log::levelFromString(j.at("logLevel").get<std::string>());

        FROM_JSON_OPTIONAL(j, state, logFile);
    }

    State State::fullyResolve() const
    {
        State resolved{*this};
        for (auto& [name, session] : resolved.sessions)
            session.useDefaultsFrom(resolved.defaults);
        return resolved;
    }
}
