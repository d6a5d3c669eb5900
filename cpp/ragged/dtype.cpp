#include "dtype.hpp"
#include "exceptions.hpp"

#include <array>
#include <utility>

namespace ragged {

namespace {

constexpr std::array<std::pair<dtype, std::string_view>, 13> dtype_names = {{
    {dtype::boolean, "bool"},
    {dtype::uint8, "uint8"},
    {dtype::uint16, "uint16"},
    {dtype::uint32, "uint32"},
    {dtype::uint64, "uint64"},
    {dtype::int8, "int8"},
    {dtype::int16, "int16"},
    {dtype::int32, "int32"},
    {dtype::int64, "int64"},
    {dtype::float32, "float32"},
    {dtype::float64, "float64"},
    {dtype::record, "record"},
    {dtype::object, "object"},
}};

} // namespace

std::string_view dtype_to_str(dtype d)
{
    for (const auto& [t, name] : dtype_names) {
        if (t == d) {
            return name;
        }
    }
    return "unknown";
}

dtype dtype_from_str(std::string_view s)
{
    for (const auto& [t, name] : dtype_names) {
        if (name == s) {
            return t;
        }
    }
    throw unknown_dtype(s);
}

} // namespace ragged
