#pragma once

#include "multidraw/core/base/base.hpp"

#include <entt/entt.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <string_view>

namespace multidraw
{
    class Logger : public entt::emitter<Logger>
    {
    public:
        Logger()              = delete;
        Logger(const Logger&) = delete;
        Logger(Logger&&) noexcept;
        ~Logger() override;

        Logger& operator=(const Logger&) = delete;
        Logger& operator=(Logger&&) noexcept;

        enum class Level : uint8_t
        {
            eTrace,
            eInfo,
            eWarn,
            eError,
            eCritical,
            eMaxLevels
        };

        Logger&             setLevel(Level);
        [[nodiscard]] Level getLevel() const;

        // Replaces the file sink of both loggers, an empty path disables it.
        Logger&                          setLogFile(std::string_view path);
        [[nodiscard]] const std::string& getLogFile() const;

        enum class Region : uint8_t
        {
            eCore,
            eClient,
        };

        template<typename... Args>
        void trace(bool isCore, std::string_view fmt, Args&&... args)
        {
            log(isCore, Level::eTrace, fmt, args...);
        }

        template<typename... Args>
        void info(bool isCore, std::string_view fmt, Args&&... args)
        {
            log(isCore, Level::eInfo, fmt, args...);
        }

        template<typename... Args>
        void warn(bool isCore, std::string_view fmt, Args&&... args)
        {
            log(isCore, Level::eWarn, fmt, args...);
        }

        template<typename... Args>
        void error(bool isCore, std::string_view fmt, Args&&... args)
        {
            log(isCore, Level::eError, fmt, args...);
        }

        template<typename... Args>
        void critical(bool isCore, std::string_view fmt, Args&&... args)
        {
            log(isCore, Level::eCritical, fmt, args...);
        }

        class Builder
        {
        public:
            Builder()                   = default;
            Builder(const Builder&)     = delete;
            Builder(Builder&&) noexcept = delete;
            ~Builder()                  = default;

            Builder operator=(const Builder&)     = delete;
            Builder operator=(Builder&&) noexcept = delete;

            Builder& setLevel(Level);
            // An empty path disables the file sink.
            Builder& setLogFile(std::string_view path);

            [[nodiscard]] Logger build() const;

        private:
            Level       m_Level = Level::eTrace;
            std::string m_LogFile {"Multidraw.log"};
        };

        struct LogEvent
        {
            Region      region;
            Level       level;
            std::string msg;

            [[nodiscard]] std::string toString() const;
        };

    private:
        Logger(Level, const std::string& logFile);

        template<typename... Args>
        void log(bool isCore, Level level, std::string_view fmt, Args&... args)
        {
            if (m_Level > level)
                return;

            const auto formatMsg = fmt::vformat(fmt, fmt::make_format_args(args...));
            getLogger(isCore)->log(toSpdlog(level), formatMsg);
            triggerLogEvent(getRegion(isCore), level, formatMsg);
        }

        [[nodiscard]] Ref<spdlog::logger> getLogger(bool isCore) { return isCore ? m_CoreLogger : m_ClientLogger; }

        void triggerLogEvent(Region, Level, std::string_view);

        [[nodiscard]] static Region                    getRegion(bool isCore) { return isCore ? Region::eCore : Region::eClient; }
        [[nodiscard]] static spdlog::level::level_enum toSpdlog(Level);

    private:
        Level       m_Level {Level::eTrace};
        std::string m_LogFile;

        spdlog::sink_ptr    m_FileSink {nullptr};
        Ref<spdlog::logger> m_CoreLogger {nullptr};
        Ref<spdlog::logger> m_ClientLogger {nullptr};
    };

    using LogEvent = Logger::LogEvent;
} // namespace multidraw
