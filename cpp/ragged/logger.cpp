#include "ragged.hpp"
#include "assert.hpp"
#include "exceptions.hpp"
#include "spdlog_adapter.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>

namespace ragged {

const log_channel log_channel::generic("generic");
const log_channel log_channel::cache("cache");
const log_channel log_channel::lazy("lazy");

std::string_view log_level_to_str(log_level t)
{
    switch (t) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    }
    return "unknown";
}

log_level str_to_log_level(std::string_view level)
{
    std::string s(level);
    std::ranges::transform(s, s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (s == "debug") {
        return log_level::debug;
    }
    if (s == "info") {
        return log_level::info;
    }
    if (s == "warn" || s == "warning") {
        return log_level::warning;
    }
    if (s == "error") {
        return log_level::error;
    }
    throw invalid_type(fmt::format("Unknown log level: {}", level));
}

void logger::log(log_level level, const std::string& channel, const std::string& message) const
{
    if (!enabled(level)) {
        return;
    }
    std::lock_guard lock(mutex_);
    for (const auto& adapter : adapters_) {
        adapter->log(level, channel, message);
    }
}

void logger::log(log_level level, const std::string& channel, fmt::string_view format, fmt::format_args args) const
{
    if (!enabled(level)) {
        return;
    }
    log(level, channel, fmt::vformat(format, args));
}

void logger::add(std::shared_ptr<logger_adapter> adapter)
{
    RAGGED_ASSERT(adapter != nullptr);
    std::lock_guard lock(mutex_);
    adapters_.push_back(std::move(adapter));
}

void logger::remove(const std::string& name)
{
    std::lock_guard lock(mutex_);
    std::erase_if(adapters_, [&name](const auto& a) {
        return a->name() == name;
    });
}

void logger::clear()
{
    std::lock_guard lock(mutex_);
    adapters_.clear();
}

bool logger::empty() const
{
    std::lock_guard lock(mutex_);
    return adapters_.empty();
}

namespace {

std::atomic<bool> initialized = false;

logger& instance()
{
    static logger l;
    return l;
}

void install_default_adapter()
{
    if (instance().empty()) {
        instance().add(std::make_shared<spdlog_adapter>());
    }
}

spdlog::level::level_enum to_spdlog_level(log_level level)
{
    switch (level) {
    case log_level::debug:
        return spdlog::level::debug;
    case log_level::info:
        return spdlog::level::info;
    case log_level::warning:
        return spdlog::level::warn;
    case log_level::error:
        return spdlog::level::err;
    }
    return spdlog::level::warn;
}

} // namespace

void initialize(std::shared_ptr<logger_adapter> adapter)
{
    instance().clear();
    instance().add(std::move(adapter));
    initialized = true;
}

void initialize(const config& c)
{
    c.layout.validate();
    install_default_adapter();
    instance().set_level(c.level);
    spdlog::set_level(to_spdlog_level(c.level));
    initialized = true;
}

void deinitialize()
{
    instance().clear();
    instance().set_level(log_level::warning);
    initialized = false;
}

bool is_initialized()
{
    return initialized;
}

logger& get_logger()
{
    if (!initialized) {
        install_default_adapter();
    }
    return instance();
}

[[noreturn]] void abort(const std::string& message)
{
    get_logger().log(log_level::error, log_channel::generic.channel(), message);
    std::abort();
}

} // namespace ragged
