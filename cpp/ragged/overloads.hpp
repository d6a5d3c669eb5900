#pragma once

namespace ragged {

/**
 * @brief Overload set built from lambdas, used with std::visit.
 */
template <typename... Ts>
struct overloads : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts>
overloads(Ts...) -> overloads<Ts...>;

} // namespace ragged
