/**
 * @file logger_adapter.cpp
 * @brief logger_system backend for the planner log
 */

#include <studyplan/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <mutex>

namespace studyplan::integration {

namespace {

constexpr std::size_t bytes_per_mb = 1024 * 1024;

constexpr std::array<const char*, 7> level_names{
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

constexpr std::array<kcenon::logger::log_level, 7> backend_levels{
    kcenon::logger::log_level::trace, kcenon::logger::log_level::debug,
    kcenon::logger::log_level::info,  kcenon::logger::log_level::warn,
    kcenon::logger::log_level::error, kcenon::logger::log_level::fatal,
    kcenon::logger::log_level::off};

auto level_index(log_level level) -> std::size_t {
    auto index = static_cast<std::size_t>(level);
    return index < level_names.size() ? index : level_names.size() - 1;
}

auto to_backend(log_level level) -> kcenon::logger::log_level {
    return backend_levels[level_index(level)];
}

}  // namespace

class logger_adapter::impl {
public:
    ~impl() { stop(); }

    void start(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (running_) {
            return;
        }

        config_ = config;
        threshold_.store(config.min_level);

        backend_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
        backend_->set_min_level(to_backend(config.min_level));
        attach_writers(config);
        backend_->start();

        running_ = true;
    }

    void stop() {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }

        backend_->flush();
        backend_->stop();
        backend_.reset();
        running_ = false;
    }

    [[nodiscard]] auto running() const noexcept -> bool { return running_.load(); }

    [[nodiscard]] auto accepts(log_level level) const noexcept -> bool {
        return running_.load() && level != log_level::off &&
               level >= threshold_.load();
    }

    void write(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (backend_ && accepts(level)) {
            backend_->log(to_backend(level), message);
        }
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->flush();
        }
    }

    void set_threshold(log_level level) {
        std::lock_guard lock(mutex_);
        threshold_.store(level);
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto threshold() const noexcept -> log_level { return threshold_.load(); }

    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

private:
    void attach_writers(const logger_config& config) {
        if (config.enable_console) {
            backend_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            std::filesystem::create_directories(config.log_directory);
            auto path = config.log_directory / config.file_name;
            backend_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                path.string(), config.max_file_size_mb * bytes_per_mb, config.max_files));
        }
    }

    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<log_level> threshold_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

void logger_adapter::initialize(const logger_config& config) { pimpl_->start(config); }

void logger_adapter::shutdown() { pimpl_->stop(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->running(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->write(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->accepts(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::log_plan_scheduled(const std::string& parent_title,
                                        std::size_t scheduled,
                                        std::size_t unscheduled) {
    if (unscheduled == 0) {
        info("Plan '{}' scheduled={} unscheduled=0", parent_title, scheduled);
        return;
    }
    warn("Plan '{}' scheduled={} unscheduled={} (limited availability)",
         parent_title, scheduled, unscheduled);
}

void logger_adapter::set_min_level(log_level level) { pimpl_->set_threshold(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->threshold(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    return level_names[level_index(level)];
}

}  // namespace studyplan::integration
