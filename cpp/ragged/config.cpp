#include "config.hpp"
#include "exceptions.hpp"
#include "getenv.hpp"

namespace ragged {

void array_layout::validate() const
{
    if (!dtype_is_integral(index)) {
        throw invalid_type(fmt::format("index dtype must be integral, got {}", dtype_to_str(index)));
    }
    if (byte != dtype::uint8 && byte != dtype::int8) {
        throw invalid_type(fmt::format("byte dtype must be uint8 or int8, got {}", dtype_to_str(byte)));
    }
}

config config::from_env()
{
    config c;
    if (auto level = getenv("RAGGED_LOG_LEVEL")) {
        c.level = str_to_log_level(*level);
    }
    if (auto index = getenv("RAGGED_INDEX_DTYPE")) {
        c.layout.index = dtype_from_str(*index);
    }
    if (auto byte = getenv("RAGGED_BYTE_DTYPE")) {
        c.layout.byte = dtype_from_str(*byte);
    }
    c.layout.validate();
    auto capacity = getenv<int64_t>("RAGGED_CACHE_CAPACITY", 0);
    if (capacity < 0) {
        throw invalid_type(fmt::format("RAGGED_CACHE_CAPACITY must be non-negative, got {}", capacity));
    }
    c.cache_capacity = static_cast<std::size_t>(capacity);
    return c;
}

} // namespace ragged
