#pragma once

/**
 * @file assert.hpp
 * @brief Assertion macros for ragged internal invariants.
 */

#ifdef RAGGED_ASSERTIONS

#include <string>

namespace ragged {

[[noreturn]] void abort(const std::string& message);

}

#define RAGGED_ASSERT_MESSAGE(expression, message)                                                                     \
    if (!(expression))                                                                                                 \
    ragged::abort(std::string("Assertion Failed: ") + #expression + "\nMessage: " + message + "\nFile: " + __FILE__ +  \
                  ":" + std::to_string(__LINE__))

#else // RAGGED_ASSERTIONS

#define RAGGED_ASSERT_MESSAGE(expression, message) ((void)0)

#endif // RAGGED_ASSERTIONS

#define RAGGED_ASSERT(expression) RAGGED_ASSERT_MESSAGE((expression), #expression)
