#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <vector>

namespace uplift::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

std::optional<LogLevel> parse_log_level(const std::string& name) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

void Logger::initialize(const std::string& log_file, LogLevel level, std::optional<LogLevel> console_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(console_level.value_or(level)));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("uplift", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    LOG_INFO("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();

        // Hand the default slot to a plain console logger so that late log
        // calls never see a null default logger, and the file sink is released.
        auto fallback = std::make_shared<spdlog::logger>(
            "uplift", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        fallback->set_level(spdlog::level::warn);
        spdlog::set_default_logger(fallback);
        logger_.reset();
    }
}

} // namespace uplift::core
