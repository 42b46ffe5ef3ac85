#include <precompiled.hpp>
#include "Logging.hpp"
#include <BuildConfiguration.hpp>

namespace TeeProxy::Logging
{
    void initialize(Options const& options)
    {
        namespace logging = boost::log;
        namespace keywords = boost::log::keywords;
        using namespace std::string_literals;

        static auto initialized = std::atomic<bool>{ false };
        if (initialized.exchange(true))
        {
            throw std::logic_error{ "Logging already initialized" };
        }

        auto const format = "[%TimeStamp%]: %Message%";

        logging::add_console_log
        (
            std::clog,
            keywords::format = format,
            keywords::auto_flush = true
        );

        if (options.fileName.has_value())
        {
            logging::add_file_log
            (
                keywords::file_name = (options.fileName.value() + "_%N.log"s),
                keywords::open_mode = (std::ios::out | std::ios::app),
                keywords::rotation_size = 1024 * 1024,
                keywords::auto_flush = true,
                keywords::format = format
            );
        }

        setFilterLevel(options.filterLevel);

        logging::add_common_attributes();

        log(Level::debug) << TEEPROXY_PROJECT_NAME << " logging initialized";
    }


    Logging::LogProxy::LogProxy(Logging::SeverityLogger& logger, Level level) :
        m_logger{ logger },
        m_record{ logger.open_record(boost::log::keywords::severity = level) }
    {
        if (m_record)
        {
            m_stream.attach_record(m_record);
            static constexpr auto levels = std::array<std::string_view, 6>
            {
                "[trace] ",
                "[debug] ",
                "[info] ",
                "[warning] ",
                "[error] ",
                "[fatal] "
            };
            m_stream << levels.at(level);
        }
    }

    Logging::LogProxy::~LogProxy()
    {
        if (m_record)
        {
            m_stream.flush();
            m_logger.push_record(std::move(m_record));
        }
    }

    Logging::LogProxy log(Level level)
    {
        static auto logger = Logging::SeverityLogger{};
        return Logging::LogProxy{ logger, level };
    }

    void setFilterLevel(Level level)
    {
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    }
    
}
