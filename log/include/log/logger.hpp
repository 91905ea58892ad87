#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    spdlog::level::level_enum toSpdlogLevel(Level lvl);
    Level fromSpdlogLevel(spdlog::level::level_enum lvl);

    /**
     * @brief Process wide logger. Writes to the console and optionally to a file.
     */
    class Logger
    {
      public:
        Logger();

        void setLevel(Log::Level level);
        Log::Level level() const;

        /**
         * @brief Adds a file sink. Calling it again replaces the previous file sink.
         *
         * @param path The log file. Parent directories are created if missing.
         * @param truncate Start with an empty file instead of appending.
         * @return true If the file could be opened.
         */
        bool setupFileSink(std::filesystem::path const& path, bool truncate);

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!shouldLog(level))
                return;
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg);

      private:
        bool shouldLog(Log::Level level) const;
        std::shared_ptr<spdlog::logger> current() const;

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
