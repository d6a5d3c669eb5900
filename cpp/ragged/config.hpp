#pragma once

/**
 * @file config.hpp
 * @brief Definition of the `config` and `array_layout` structures.
 */

#include "dtype.hpp"
#include "logger.hpp"

#include <cstddef>

namespace ragged {

/**
 * @brief Element types of the arrays the library creates on its own.
 *
 * `index` is used for index and tag arrays built internally (empty index re-views, gather positions,
 * scratch offsets), `byte` for raw byte buffers.
 */
struct array_layout
{
    dtype index = dtype::int64;
    dtype byte = dtype::uint8;

    /// Throws `invalid_type` when `index` is not integral or `byte` is not a one byte integer type.
    void validate() const;
};

struct config
{
    log_level level = log_level::warning;
    array_layout layout;
    std::size_t cache_capacity = 0;

    /**
     * @brief Builds the configuration from `RAGGED_LOG_LEVEL`, `RAGGED_INDEX_DTYPE`, `RAGGED_BYTE_DTYPE` and
     * `RAGGED_CACHE_CAPACITY`. Unset variables keep their defaults.
     */
    static config from_env();
};

} // namespace ragged
