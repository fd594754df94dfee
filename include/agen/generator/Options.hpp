#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace agen {

/// How requests are settled once the generator has completed.
enum class CompletedRequestPolicy : uint8_t {
    /// Every request fulfills with `{undefined, done: true}`, whatever its kind.
    /// An error thrown by the body is surfaced exactly once, to the request that ran it.
    SettleAsDone,
    /// `next` fulfills `{undefined, true}`, `return(v)` fulfills `{v, true}`, `throw(e)` rejects with `e`.
    LanguageRule,
};

constexpr std::string_view policyName(CompletedRequestPolicy policy) noexcept {
    switch (policy) {
        case CompletedRequestPolicy::SettleAsDone: return "settle-as-done";
        case CompletedRequestPolicy::LanguageRule: return "language-rule";
    }

    return "<invalid>";
}

struct GeneratorOptions {
    /// Name used in trace output, defaults to the generator's address.
    std::string debugName;
    CompletedRequestPolicy completedPolicy = CompletedRequestPolicy::SettleAsDone;
    /// Number of local slots to reserve in the suspension frame.
    size_t frameSlots = 0;
};

}
