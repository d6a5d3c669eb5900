#pragma once

/**
 * @file mpl.hpp
 * @brief Member detection for array adaptors.
 */

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ragged {

class array;
class slice;
struct element_value;

namespace impl {

template <typename T>
concept has_element_member_function = requires(const T& t, int64_t i) {
    { t.element(i) } -> std::same_as<element_value>;
};

template <typename T>
concept has_get_member_function = requires(const T& t, int64_t i) {
    { t.get(i) } -> std::same_as<array>;
};

template <typename T>
concept has_slice_member_function = requires(const T& t, const slice& s) {
    { t.slice(s) } -> std::same_as<array>;
};

template <typename T>
concept has_take_member_function = requires(const T& t, const array& positions) {
    { t.take(positions) } -> std::same_as<array>;
};

template <typename T>
concept has_field_member_function = requires(const T& t, std::string_view name) {
    { t.field(name) } -> std::same_as<array>;
};

template <typename T>
concept has_fields_member_function = requires(const T& t) {
    { t.fields() } -> std::same_as<std::vector<std::string>>;
};

template <typename T>
concept has_set_member_function = requires(T& t, int64_t i, const array& v) { t.set(i, v); };

template <typename T>
concept has_put_member_function = requires(T& t, const array& positions, const array& v) { t.put(positions, v); };

template <typename T>
concept has_writeable_member_function = requires(const T& t) {
    { t.writeable() } -> std::same_as<bool>;
};

template <typename T>
concept has_set_writeable_member_function = requires(T& t, bool b) { t.set_writeable(b); };

template <typename T>
concept has_is_none_member_variable = requires { T::is_none; };

template <typename T>
concept has_owns_addressing_member_variable = requires { T::owns_addressing; };

} // namespace impl

} // namespace ragged
