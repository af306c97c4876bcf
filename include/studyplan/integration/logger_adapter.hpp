/**
 * @file logger_adapter.hpp
 * @brief Planner logging facade over logger_system
 *
 * Scheduling code logs through the static logger_adapter. Nothing is written
 * until initialize() has been called, which lets the library log
 * unconditionally while embedding applications decide where output goes.
 */

#pragma once

#include <studyplan/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace studyplan::integration {

/**
 * @enum log_level
 * @brief Severity, in increasing order
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @struct logger_config
 * @brief Output targets and filtering for the planner log
 */
struct logger_config {
    /// Directory that receives the log file
    std::filesystem::path log_directory{"logs"};

    /// Log file name inside log_directory
    std::string file_name{"studyplan.log"};

    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{false};

    /// Rotation threshold in megabytes
    std::size_t max_file_size_mb{10};

    /// Rotated files kept next to the active one
    std::size_t max_files{5};

    bool async_mode{false};
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logger for the planner
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::debug("Placed {} of {} items", placed, total);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Create writers and start logging
     *
     * A second call while initialized keeps the first configuration.
     */
    static void initialize(const logger_config& config);

    /// Flush and stop; safe to call when not initialized
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(studyplan::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(studyplan::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(studyplan::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(studyplan::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(studyplan::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    /// Write a preformatted message
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check whether a message at this level would be written
     * @return false when not initialized or filtered out
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    /**
     * @brief Record the outcome of one scheduling run
     *
     * Logged at warn level when some items found no slot, info otherwise.
     */
    static void log_plan_scheduled(const std::string& parent_title,
                                   std::size_t scheduled,
                                   std::size_t unscheduled);

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /// Upper-case level name, e.g. "WARN"
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    // Formats only when the level passes the filter
    template <typename... Args>
    static void emit(log_level level, studyplan::compat::format_string<Args...> fmt,
                     Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, studyplan::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace studyplan::integration
