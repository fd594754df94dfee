#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace agen {

// Assert macro
#define AGEN__GET_MACRO(_0, _1, _2, name, ...) name
#define AGEN_ASSERT(...) AGEN__GET_MACRO(_0, ##__VA_ARGS__, AGEN__ASSERT2, AGEN__ASSERT1, AGEN__ASSERT0)(__VA_ARGS__)

#define AGEN__ASSERT2(condition, msg) \
    do { \
        if (!(condition)) [[unlikely]] { \
            ::agen::_assertionFail(#condition, msg, __FILE__, __LINE__); \
        } \
    } while (false)
#define AGEN__ASSERT1(condition) AGEN__ASSERT2(condition, "")

#if defined AGEN_DEBUG
# define AGEN_DEBUG_ASSERT AGEN_ASSERT
#else
# define AGEN_DEBUG_ASSERT(...) (void)0
#endif

/// Thrown when an internal invariant of the generator core is broken.
/// This is never a body-level error and is never turned into a promise rejection.
struct AssertionFailure : std::logic_error {
    using std::logic_error::logic_error;
};

[[noreturn]] void _assertionFail(std::string_view what, std::string_view why, std::string_view file, int line);

}
