#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    /**
     * @brief Parses a level name as used in the configuration file. Unknown names map to Info.
     */
    inline Level levelFromString(std::string_view str)
    {
        const std::string lowered = Utility::Algorithm::toLowerCase(std::string{str});

        if (lowered == "trace")
            return Level::Trace;
        else if (lowered == "debug")
            return Level::Debug;
        else if (lowered == "warning" || lowered == "warn")
            return Level::Warning;
        else if (lowered == "error")
            return Level::Error;
        else if (lowered == "critical")
            return Level::Critical;
        else if (lowered == "off")
            return Level::Off;
        return Level::Info;
    }

    inline std::string levelToString(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return "trace";
            case Level::Debug:
                return "debug";
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
            case Level::Critical:
                return "critical";
            case Level::Off:
                return "off";
            default:
                return "info";
        }
    }
}
