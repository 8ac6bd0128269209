#pragma once

// Logger.hpp - обёртка над Boost.Log: глобальный severity+channel логгер,
// RAII-установка консольного и файлового синков и макросы LOG*("channel") << ...

#include <cstddef>
#include <memory>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    struct Options
    {
        std::string app_name      = "HotspotForge";
        std::string directory     = "logs";
        std::string base_filename = "hotspot";

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::debug;

        std::size_t rotation_size = 10 * 1024 * 1024; // байт на файл
        bool        to_file       = true;
        bool        to_console    = true;
    };

    // Ставит синки в конструкторе и снимает их в деструкторе.
    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        struct Sinks;
        std::unique_ptr<Sinks> sinks_;
    };

    Source &Get();
}

#define LOG_CHANNEL_SEV_(sev, ch) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(ch), ::boost::log::trivial::sev)

#define LOGT(ch) LOG_CHANNEL_SEV_(trace,   ch)
#define LOGD(ch) LOG_CHANNEL_SEV_(debug,   ch)
#define LOGI(ch) LOG_CHANNEL_SEV_(info,    ch)
#define LOGW(ch) LOG_CHANNEL_SEV_(warning, ch)
#define LOGE(ch) LOG_CHANNEL_SEV_(error,   ch)
