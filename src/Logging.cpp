#include "Logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    constexpr const char* kLoggerName = "lookout";
    constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

bool initLogging(const LogConfig& config, std::string* outError)
{
    const auto level = spdlog::level::from_str(config.level == "warning" ? "warn" : config.level);
    try
    {
        auto logger = spdlog::get(kLoggerName);
        if (!logger)
            logger = spdlog::basic_logger_mt(kLoggerName, config.file, true);
        logger->set_pattern(kPattern);
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }
    catch (const spdlog::spdlog_ex& e)
    {
        if (outError) *outError = "cannot open log file " + config.file + ": " + e.what();
        return false;
    }
    spdlog::info("lookout starting, log level {}", spdlog::level::to_string_view(level));
    return true;
}

void shutdownLogging()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}
