// ============================================================================
// TACORE - Logger Implementation
// ============================================================================

#include "tacore/utils/logger.hpp"

#include "tacore/core/field.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <mutex>
#include <utility>
#include <vector>

namespace tacore::utils {

namespace {

constexpr const char* LOGGER_NAME = "tacore";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel from_spdlog(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:
            return LogLevel::Trace;
        case spdlog::level::debug:
            return LogLevel::Debug;
        case spdlog::level::info:
            return LogLevel::Info;
        case spdlog::level::warn:
            return LogLevel::Warn;
        case spdlog::level::err:
            return LogLevel::Error;
        case spdlog::level::critical:
            return LogLevel::Critical;
        default:
            return LogLevel::Off;
    }
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

LogLevel level_from_string(std::string_view text) noexcept {
    constexpr std::array<std::pair<std::string_view, LogLevel>, 8> names = {{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    }};

    for (const auto& [name, level] : names) {
        if (iequals(text, name)) return level;
    }
    return LogLevel::Info;
}

struct Logger::Impl {
    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;

    std::shared_ptr<spdlog::logger> get() const {
        std::lock_guard lock(mutex);
        return logger;
    }

    void reset(std::shared_ptr<spdlog::logger> next) {
        std::lock_guard lock(mutex);
        logger = std::move(next);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {
    impl_->reset(make_logger(LogConfig{}));
}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    auto& self = instance();
    if (auto previous = self.impl_->get()) {
        previous->flush();
    }
    self.impl_->reset(make_logger(config));
}

void Logger::shutdown() {
    auto& self = instance();
    if (auto logger = self.impl_->get()) {
        logger->flush();
        logger->set_level(spdlog::level::off);
    }
}

void Logger::set_level(LogLevel level) {
    impl_->get()->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return from_spdlog(impl_->get()->level());
}

bool Logger::should_log(LogLevel level) const {
    return impl_->get()->should_log(to_spdlog(level));
}

void Logger::log(LogLevel level, std::string_view message) {
    impl_->get()->log(to_spdlog(level), spdlog::string_view_t{message.data(), message.size()});
}

void Logger::flush() {
    impl_->get()->flush();
}

}  // namespace tacore::utils
