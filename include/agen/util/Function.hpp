#pragma once
#include <std23/move_only_function.h>
#include <functional>

namespace agen {
#ifdef _WIN32
    template <class Signature>
    using MoveOnlyFunction = std::move_only_function<Signature>;
#else
    template <class Signature>
    using MoveOnlyFunction = std23::move_only_function<Signature>;
#endif
}
