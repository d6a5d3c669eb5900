#pragma once

#include "logger_adapter.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ragged {

/**
 * @brief Forwards ragged log messages to an spdlog logger, prefixed with the channel name.
 */
class spdlog_adapter : public logger_adapter
{
public:
    spdlog_adapter()
        : logger_(spdlog::default_logger())
    {
    }

    explicit spdlog_adapter(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
    {
    }

    ~spdlog_adapter() override = default;

    [[nodiscard]] std::string name() const override
    {
        return "spdlog";
    }

    void log(log_level level, const std::string& channel, const std::string& message) override
    {
        switch (level) {
        case log_level::debug:
            logger_->debug("[{}] {}", channel, message);
            break;
        case log_level::info:
            logger_->info("[{}] {}", channel, message);
            break;
        case log_level::warning:
            logger_->warn("[{}] {}", channel, message);
            break;
        case log_level::error:
            logger_->error("[{}] {}", channel, message);
            break;
        }
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ragged
