#pragma once

#include <string>

namespace ragged {

class log_channel
{
public:
    [[nodiscard]] const std::string& channel() const
    {
        return channel_;
    }

    static const log_channel generic;
    static const log_channel cache;
    static const log_channel lazy;

private:
    explicit log_channel(std::string channel)
        : channel_(std::move(channel))
    {
    }

    std::string channel_;
};

} // namespace ragged
