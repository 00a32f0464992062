#include "multidraw/core/base/logger.hpp"

#include <magic_enum/magic_enum.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace
{
    spdlog::sink_ptr makeFileSink(const std::string& path)
    {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S:%f] [%l] %n: %v");
        return sink;
    }
} // namespace

namespace multidraw
{
    Logger::Logger(Logger&& other) noexcept :
        emitter {std::move(other)}, m_Level(other.m_Level), m_LogFile(std::move(other.m_LogFile)),
        m_FileSink(std::move(other.m_FileSink)), m_CoreLogger(std::move(other.m_CoreLogger)),
        m_ClientLogger(std::move(other.m_ClientLogger))
    {}

    Logger::~Logger()
    {
        clear();

        // A moved-from logger owns no sinks and must not tear down the registry.
        if (m_CoreLogger)
        {
            spdlog::drop(m_CoreLogger->name());
            spdlog::drop(m_ClientLogger->name());
        }
    }

    Logger& Logger::operator=(Logger&& rhs) noexcept
    {
        if (this != &rhs)
        {
            emitter::operator=(std::move(rhs));
            m_Level = rhs.m_Level;
            std::swap(m_LogFile, rhs.m_LogFile);
            std::swap(m_FileSink, rhs.m_FileSink);
            std::swap(m_CoreLogger, rhs.m_CoreLogger);
            std::swap(m_ClientLogger, rhs.m_ClientLogger);
        }

        return *this;
    }

    Logger& Logger::setLevel(Level level)
    {
        m_Level = level;
        return *this;
    }

    Logger::Level Logger::getLevel() const { return m_Level; }

    Logger& Logger::setLogFile(std::string_view path)
    {
        assert(m_CoreLogger && m_ClientLogger);

        // Open the new file first, a failure leaves the current sink in place.
        std::string      logFile {path};
        spdlog::sink_ptr fileSink = logFile.empty() ? nullptr : makeFileSink(logFile);

        for (const auto& logger : {m_CoreLogger, m_ClientLogger})
        {
            auto& sinks = logger->sinks();
            if (m_FileSink)
            {
                std::erase(sinks, m_FileSink);
            }
            if (fileSink)
            {
                sinks.push_back(fileSink);
            }
        }

        m_FileSink = std::move(fileSink);
        m_LogFile  = std::move(logFile);
        return *this;
    }

    const std::string& Logger::getLogFile() const { return m_LogFile; }

    Logger::Builder& Logger::Builder::setLevel(Level level)
    {
        m_Level = level;
        return *this;
    }

    Logger::Builder& Logger::Builder::setLogFile(std::string_view path)
    {
        m_LogFile = path;
        return *this;
    }

    Logger Logger::Builder::build() const { return Logger {m_Level, m_LogFile}; }

    std::string Logger::LogEvent::toString() const
    {
        return fmt::format(
            "Level: {}, Region: {}, Message: {}", magic_enum::enum_name(level), magic_enum::enum_name(region), msg);
    }

    Logger::Logger(const Level level, const std::string& logFile)
    {
        m_Level = level;

        std::vector<spdlog::sink_ptr> logSinks;

        logSinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        logSinks.back()->set_pattern("%^[%Y-%m-%d %H:%M:%S:%f] %n: %v%$");

        if (!logFile.empty())
        {
            m_LogFile  = logFile;
            m_FileSink = makeFileSink(logFile);
            logSinks.push_back(m_FileSink);
        }

        m_CoreLogger = std::make_shared<spdlog::logger>("MULTIDRAW_CORE", begin(logSinks), end(logSinks));
        spdlog::register_logger(m_CoreLogger);
        m_CoreLogger->set_level(spdlog::level::trace);
        m_CoreLogger->flush_on(spdlog::level::trace);

        m_ClientLogger = std::make_shared<spdlog::logger>("MULTIDRAW_CLIENT", begin(logSinks), end(logSinks));
        spdlog::register_logger(m_ClientLogger);
        m_ClientLogger->set_level(spdlog::level::trace);
        m_ClientLogger->flush_on(spdlog::level::trace);
    }

    void Logger::triggerLogEvent(Region region, Level level, std::string_view msg)
    {
        publish<LogEvent>({region, level, std::string {msg}});
    }

    spdlog::level::level_enum Logger::toSpdlog(const Level level)
    {
        switch (level)
        {
            using enum Level;

            case eTrace:
                return spdlog::level::trace;
            case eInfo:
                return spdlog::level::info;
            case eWarn:
                return spdlog::level::warn;
            case eError:
                return spdlog::level::err;
            case eCritical:
                return spdlog::level::critical;

            default:
                return spdlog::level::off;
        }
    }
} // namespace multidraw
