#pragma once

#include "config.hpp"
#include "log_channel.hpp"
#include "logger_adapter.hpp"

#include <memory>
#include <string>

/**
 * @file ragged.hpp
 * @brief Definition of ragged module level functions.
 */

/**
 * @defgroup ragged
 * @{
 * @brief Index, nullable, union and lazy array views over columnar content.
 *
 * @}
 */

namespace ragged {

/**
 * @brief Initialize the module with the given log adapter. Replaces any previously installed adapters.
 *
 * @param adapter
 */
void initialize(std::shared_ptr<logger_adapter> adapter);

/**
 * @brief Applies the log level of `c`. Installs the spdlog adapter if no adapter was installed.
 */
void initialize(const config& c);

void deinitialize();

bool is_initialized();

/// Process wide logger. Falls back to the spdlog adapter when the module was not initialized.
logger& get_logger();

template <typename... Args>
inline void log_debug(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    if (get_logger().enabled(log_level::debug)) {
        get_logger().log(log_level::debug, channel.channel(), fmt::format(message, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void log_info(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    if (get_logger().enabled(log_level::info)) {
        get_logger().log(log_level::info, channel.channel(), fmt::format(message, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void log_warning(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    if (get_logger().enabled(log_level::warning)) {
        get_logger().log(log_level::warning, channel.channel(), fmt::format(message, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void log_error(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    get_logger().log(log_level::error, channel.channel(), fmt::format(message, std::forward<Args>(args)...));
}

} // namespace ragged
