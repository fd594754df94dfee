#pragma once
#include <type_traits>
#include <utility>

namespace agen {

/// Runs `func` when the returned guard goes out of scope, including during unwinding.
template <typename F>
auto scopeDtor(F&& func) {
    struct ScopeDtor {
        std::decay_t<F> m_func;

        ~ScopeDtor() {
            m_func();
        }
    };

    return ScopeDtor{std::forward<F>(func)};
}

}
