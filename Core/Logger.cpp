#include "Logger.hpp"

#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/keywords/channel.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace logging  = boost::log;
namespace sinks    = boost::log::sinks;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(log_channel,  "Channel",  std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(log_severity, "Severity", Logger::Severity)

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(hotspot_logger, Logger::Source)

namespace
{
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    auto MakeFormatter()
    {
        return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << log_severity << "]"
            << " [" << log_channel << "] "
            << expr::smessage;
    }
}

namespace Logger
{
    struct Guard::Sinks
    {
        boost::shared_ptr<ConsoleSink> console;
        boost::shared_ptr<FileSink>    file;
    };

    Source &Get()
    {
        return hotspot_logger::get();
    }

    Guard::Guard(const Options &options)
        : sinks_(std::make_unique<Sinks>())
    {
        auto core = logging::core::get();
        logging::add_common_attributes();

        if (options.to_console)
        {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            sinks_->console = boost::make_shared<ConsoleSink>(backend);
            sinks_->console->set_formatter(MakeFormatter());
            sinks_->console->set_filter(log_severity >= options.console_min_severity);
            core->add_sink(sinks_->console);
        }

        if (options.to_file)
        {
            const std::string pattern = options.directory + "/" + options.base_filename + "_%Y%m%d_%N.log";
            auto backend = boost::make_shared<sinks::text_file_backend>(
                keywords::file_name     = pattern,
                keywords::rotation_size = options.rotation_size,
                keywords::open_mode     = std::ios_base::out | std::ios_base::app);
            backend->auto_flush(true);

            sinks_->file = boost::make_shared<FileSink>(backend);
            sinks_->file->set_formatter(MakeFormatter());
            sinks_->file->set_filter(log_severity >= options.file_min_severity);
            core->add_sink(sinks_->file);
        }

        LOGI("logger") << options.app_name << ": logging started"
                       << " (file=" << (options.to_file ? options.directory : std::string("off")) << ")";
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        if (sinks_->file)
        {
            core->remove_sink(sinks_->file);
            sinks_->file->flush();
        }
        if (sinks_->console)
        {
            core->remove_sink(sinks_->console);
            sinks_->console->flush();
        }
    }
}
