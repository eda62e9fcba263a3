// BoostLogger.hpp
#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace QEMUKIT {

namespace bl = boost::log;
namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

class BoostLogger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    struct Config {
        std::string name = "qemukit";
        std::string file_path = "logs/qemukit.log";
        Level console_level = Level::Warning;
        Level file_level = Level::Trace;
        std::size_t rotation_size = 10 * 1024 * 1024; // 10 MB
        int max_files = 5;
        bool enable_console = true;
        bool enable_file = false;
    };

    // (Re)configure the sinks; safe to call again after the lazy default init
    static void Init(const Config& config);

    // "trace", "debug", "info", "warning"/"warn", "error", "fatal"/"critical"
    static std::optional<Level> ParseLevel(std::string_view name);

    static void Trace(const auto& msg) { log_impl(trivial::trace, msg); }
    static void Debug(const auto& msg) { log_impl(trivial::debug, msg); }
    static void Info(const auto& msg) { log_impl(trivial::info, msg); }
    static void Warn(const auto& msg) { log_impl(trivial::warning, msg); }
    static void Error(const auto& msg) { log_impl(trivial::error, msg); }
    static void Critical(const auto& msg) { log_impl(trivial::fatal, msg); }

private:
    inline static src::severity_logger_mt<trivial::severity_level> s_logger;
    inline static bool s_initialized = false;

    static trivial::severity_level to_boost_level(Level level);
    static void log_impl(trivial::severity_level lvl, const auto& msg);
};

inline trivial::severity_level BoostLogger::to_boost_level(Level level) {
    switch (level) {
        case Level::Trace:    return trivial::trace;
        case Level::Debug:    return trivial::debug;
        case Level::Info:     return trivial::info;
        case Level::Warning:  return trivial::warning;
        case Level::Error:    return trivial::error;
        case Level::Fatal:    return trivial::fatal;
        default:              return trivial::info;
    }
}

inline std::optional<BoostLogger::Level> BoostLogger::ParseLevel(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "fatal" || name == "critical") return Level::Fatal;
    return std::nullopt;
}

inline void BoostLogger::log_impl(trivial::severity_level lvl, const auto& msg) {
    if (!s_initialized) {
        Init(Config{});
    }
    BOOST_LOG_SEV(s_logger, lvl) << msg;
}

inline void BoostLogger::Init(const Config& config) {
    // drop sinks of a previous Init so records are not duplicated
    bl::core::get()->remove_all_sinks();

    bl::add_common_attributes();

    if (config.enable_console) {
        auto console_sink = bl::add_console_log(
            std::clog,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%"
        );
        console_sink->set_filter(trivial::severity >= to_boost_level(config.console_level));
    }

    if (config.enable_file) {
        auto file_sink = bl::add_file_log(
            bl::keywords::file_name = config.file_path,
            bl::keywords::rotation_size = config.rotation_size,
            bl::keywords::max_size = config.rotation_size * config.max_files,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
            bl::keywords::auto_flush = true
        );
        file_sink->set_filter(trivial::severity >= to_boost_level(config.file_level));
    }

    bl::core::get()->set_filter(trivial::severity >= trivial::trace);

    s_initialized = true;
}

} // namespace QEMUKIT
