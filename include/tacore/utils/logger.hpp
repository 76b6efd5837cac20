#pragma once
// ============================================================================
// TACORE - Logger
// ============================================================================
// Thin wrapper over spdlog used for configuration diagnostics and the driver
// Nothing on the per-bar path logs
// ============================================================================

#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace tacore::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Case-insensitive ("warn", "INFO", ...); falls back to Info
[[nodiscard]] LogLevel level_from_string(std::string_view text) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file;  // empty = stderr only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    // Rotating file settings
    size_t max_file_size_mb = 10;
    size_t max_files = 3;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Replace the global sinks (stderr, plus a rotating file when configured)
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and drop all sinks
    static void shutdown();

    /// Global instance, lazily bound to a stderr sink
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool should_log(LogLevel level) const;

    template <typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        log_formatted(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    template <typename... Args>
    void log_formatted(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level)) return;
        log(level, fmt::format(fmt, std::forward<Args>(args)...));
    }

    void log(LogLevel level, std::string_view message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define TACORE_LOG_TRACE(...) ::tacore::utils::Logger::instance().trace(__VA_ARGS__)
#define TACORE_LOG_DEBUG(...) ::tacore::utils::Logger::instance().debug(__VA_ARGS__)
#define TACORE_LOG_INFO(...) ::tacore::utils::Logger::instance().info(__VA_ARGS__)
#define TACORE_LOG_WARN(...) ::tacore::utils::Logger::instance().warn(__VA_ARGS__)
#define TACORE_LOG_ERROR(...) ::tacore::utils::Logger::instance().error(__VA_ARGS__)
#define TACORE_LOG_CRITICAL(...) ::tacore::utils::Logger::instance().critical(__VA_ARGS__)

}  // namespace tacore::utils
