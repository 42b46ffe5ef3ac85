#pragma once
#include <precompiled.hpp>

namespace TeeProxy::Logging
{
    using Level = boost::log::trivial::severity_level;

    struct Options
    {
        Level filterLevel = Level::info;
        // Rotating log file written in addition to the console when set.
        std::optional<std::string> fileName;
    };

    class Logging
    {
    public:
        using SeverityLogger = boost::log::sources::severity_logger_mt<Level>;
        using LogRecord = boost::log::record;
        using LogStream = boost::log::record_ostream;
        class LogProxy;
    };

    class Logging::LogProxy
    {
    private:
        SeverityLogger& m_logger;
        LogRecord m_record;
        LogStream m_stream;
    public:
        LogProxy(Logging::SeverityLogger& logger, Level level);
        LogProxy(LogProxy const&) = delete;
        LogProxy& operator=(LogProxy const&) = delete;
        ~LogProxy();

        template<typename T>
        LogStream& operator<<(T&& argument);
    };

    // Installs the sinks. Must be called once, before the worker threads start.
    void initialize(Options const& options);

    Logging::LogProxy log(Level level);

    void setFilterLevel(Level level);

    template<typename T>
    Logging::LogStream& Logging::LogProxy::operator<<(T&& argument)
    {
        if (m_record)
        {
            m_stream << std::forward<T>(argument);
        }
        return m_stream;
    }

    template<typename Type, typename... Arguments>
    void logLine(Level const level, Arguments&&... arguments)
    {
        auto logProxy = log(level);
        logProxy << Type::description << ": ";
        (logProxy << ... << std::forward<Arguments>(arguments));
    }
}
