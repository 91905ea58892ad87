#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return spdlog::level::trace;
            case Level::Debug:
                return spdlog::level::debug;
            case Level::Info:
                return spdlog::level::info;
            case Level::Warning:
                return spdlog::level::warn;
            case Level::Error:
                return spdlog::level::err;
            case Level::Critical:
                return spdlog::level::critical;
            case Level::Off:
                return spdlog::level::off;
            default:
                return spdlog::level::info;
        }
    }

    Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        switch (lvl)
        {
            case spdlog::level::trace:
                return Level::Trace;
            case spdlog::level::debug:
                return Level::Debug;
            case spdlog::level::info:
                return Level::Info;
            case spdlog::level::warn:
                return Level::Warning;
            case spdlog::level::err:
                return Level::Error;
            case spdlog::level::critical:
                return Level::Critical;
            case spdlog::level::off:
                return Level::Off;
            default:
                return Level::Info;
        }
    }

    Logger::Logger()
        : guard_{}
        , logger_{std::make_shared<spdlog::logger>(
              "courier",
              std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
    {
        logger_->set_level(spdlog::level::info);
    }

    void Logger::setLevel(Log::Level level)
    {
        current()->set_level(toSpdlogLevel(level));
    }

    Log::Level Logger::level() const
    {
        return fromSpdlogLevel(current()->level());
    }

    bool Logger::setupFileSink(std::filesystem::path const& path, bool truncate)
    {
        std::error_code ec{};
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path(), ec);

        std::shared_ptr<spdlog::sinks::basic_file_sink_mt> fileSink{};
        try
        {
            fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), truncate);
        }
        catch (spdlog::spdlog_ex const& e)
        {
            logImpl(Level::Error, spdlog::fmt_lib::format("Cannot open log file '{}': {}", path.string(), e.what()));
            return false;
        }

        std::scoped_lock lock{guard_};
        std::vector<spdlog::sink_ptr> sinks{
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
            std::move(fileSink),
        };
        auto replacement = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
        replacement->set_level(logger_->level());
        logger_ = std::move(replacement);
        return true;
    }

    void Logger::logImpl(Log::Level level, std::string const& msg)
    {
        current()->log(toSpdlogLevel(level), msg);
    }

    bool Logger::shouldLog(Log::Level level) const
    {
        return current()->should_log(toSpdlogLevel(level));
    }

    std::shared_ptr<spdlog::logger> Logger::current() const
    {
        std::scoped_lock lock{guard_};
        return logger_;
    }
}
