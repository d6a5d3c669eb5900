#pragma once

/**
 * @file function.hpp
 * @brief Definition of the `function` alias used for generators and external callables.
 */

#include <absl/functional/any_invocable.h>

namespace ragged {

template <typename F>
using function = absl::AnyInvocable<F>;

}
