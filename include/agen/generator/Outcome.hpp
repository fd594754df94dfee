#pragma once
#include "Await.hpp"
#include "Resumption.hpp"
#include <agen/util/Assert.hpp>
#include <exception>
#include <utility>
#include <variant>

namespace agen {

enum class OutcomeKind : uint8_t {
    NormalCompletion,
    YieldSignal,
    ThrownError,
    AwaitSignal,
};

template <typename T>
struct NormalCompletion {
    MaybeValue<T> value;
};

template <typename T>
struct YieldSignal {
    MaybeValue<T> value;
};

struct ThrownError {
    std::exception_ptr error;
};

template <typename T>
struct AwaitSignal {
    Awaited<T> awaited;
};

/// How one run of a generator body ended. Returned by body evaluators instead of
/// signalling suspension through exceptions, so a yield can never be mistaken for a fault.
template <typename T>
class BodyOutcome {
public:
    static BodyOutcome complete(MaybeValue<T> value = std::nullopt) {
        return BodyOutcome{NormalCompletion<T>{std::move(value)}};
    }

    static BodyOutcome yield(MaybeValue<T> value = std::nullopt) {
        return BodyOutcome{YieldSignal<T>{std::move(value)}};
    }

    static BodyOutcome thrown(std::exception_ptr error) {
        return BodyOutcome{ThrownError{std::move(error)}};
    }

    static BodyOutcome await(Awaited<T> awaited) {
        return BodyOutcome{AwaitSignal<T>{std::move(awaited)}};
    }

    OutcomeKind kind() const noexcept {
        return static_cast<OutcomeKind>(m_data.index());
    }

    bool isCompletion() const noexcept { return this->kind() == OutcomeKind::NormalCompletion; }
    bool isYield() const noexcept { return this->kind() == OutcomeKind::YieldSignal; }
    bool isThrow() const noexcept { return this->kind() == OutcomeKind::ThrownError; }
    bool isAwait() const noexcept { return this->kind() == OutcomeKind::AwaitSignal; }

    /// The completion or yielded value.
    MaybeValue<T>& value() {
        if (auto c = std::get_if<NormalCompletion<T>>(&m_data)) {
            return c->value;
        }

        auto y = std::get_if<YieldSignal<T>>(&m_data);
        AGEN_ASSERT(y != nullptr, "value() called on an outcome that carries no value");
        return y->value;
    }

    std::exception_ptr error() const {
        auto t = std::get_if<ThrownError>(&m_data);
        AGEN_ASSERT(t != nullptr, "error() called on an outcome that is not a thrown error");
        return t->error;
    }

    Awaited<T> takeAwaited() && {
        auto a = std::get_if<AwaitSignal<T>>(&m_data);
        AGEN_ASSERT(a != nullptr, "takeAwaited() called on an outcome that is not an await");
        return std::move(a->awaited);
    }

private:
    using Data = std::variant<NormalCompletion<T>, YieldSignal<T>, ThrownError, AwaitSignal<T>>;

    explicit BodyOutcome(Data data) : m_data(std::move(data)) {}

    Data m_data;
};

constexpr std::string_view outcomeName(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::NormalCompletion: return "completion";
        case OutcomeKind::YieldSignal: return "yield";
        case OutcomeKind::ThrownError: return "throw";
        case OutcomeKind::AwaitSignal: return "await";
    }

    return "<invalid>";
}

}
