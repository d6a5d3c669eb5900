#pragma once

/**
 * @file logger.hpp
 * @brief Definition of the `logger` class.
 */

#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ragged {

class logger_adapter;

enum class log_level : unsigned char
{
    debug,
    info,
    warning,
    error
};

std::string_view log_level_to_str(log_level t);

/// Parses a case-insensitive level name ("debug", "info", "warn"/"warning", "error").
/// Throws `invalid_type` for anything else.
log_level str_to_log_level(std::string_view level);

class logger
{
public:
    logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger& operator=(logger&&) = delete;
    ~logger() = default;

    void log(log_level level, const std::string& channel, const std::string& message) const;

    void log(log_level level, const std::string& channel, fmt::string_view format, fmt::format_args args) const;

    void add(std::shared_ptr<logger_adapter> adapter);

    void remove(const std::string& name);

    void clear();

    bool empty() const;

    void set_level(log_level level) noexcept
    {
        level_ = level;
    }

    log_level level() const noexcept
    {
        return level_;
    }

    bool enabled(log_level level) const noexcept
    {
        return level >= level_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<logger_adapter>> adapters_;
    log_level level_ = log_level::warning;
};

} // namespace ragged
