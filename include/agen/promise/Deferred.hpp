#pragma once
#include <agen/util/Assert.hpp>
#include <agen/util/Config.hpp>
#include <agen/util/Error.hpp>
#include <agen/util/Function.hpp>
#include <agen/util/Trace.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace agen {

enum class PromiseStatus : uint8_t {
    Pending,
    Fulfilled,
    Rejected,
};

template <typename R>
struct PromiseShared {
    struct Reaction {
        MoveOnlyFunction<void(const R&)> onFulfill;
        MoveOnlyFunction<void(std::exception_ptr)> onReject;
    };

    PromiseStatus status = PromiseStatus::Pending;
    std::optional<R> value;
    std::exception_ptr error;
    std::vector<Reaction> reactions;

    bool isPending() const noexcept {
        return status == PromiseStatus::Pending;
    }

    void fulfill(R v) {
        AGEN_ASSERT(this->isPending(), "promise settled more than once");
        value = std::move(v);
        status = PromiseStatus::Fulfilled;
        this->runReactions();
    }

    void reject(std::exception_ptr e) {
        AGEN_ASSERT(this->isPending(), "promise settled more than once");
        error = std::move(e);
        status = PromiseStatus::Rejected;
        this->runReactions();
    }

    void react(Reaction reaction) {
        if (this->isPending()) {
            reactions.push_back(std::move(reaction));
        } else {
            this->dispatch(reaction);
        }
    }

private:
    void runReactions() {
        // a reaction may register further reactions on this promise
        auto pending = std::move(reactions);
        reactions.clear();

        for (auto& reaction : pending) {
            this->dispatch(reaction);
        }
    }

    void dispatch(Reaction& reaction) {
        if (status == PromiseStatus::Fulfilled) {
            if (reaction.onFulfill) reaction.onFulfill(*value);
        } else if (reaction.onReject) {
            reaction.onReject(error);
        }
    }
};

/// The observable half of a deferred. Cheap to copy, all copies observe the same settlement.
template <typename R>
class Promise {
public:
    explicit Promise(std::shared_ptr<PromiseShared<R>> state) : m_state(std::move(state)) {}

    bool isPending() const noexcept {
        return m_state->isPending();
    }

    bool isFulfilled() const noexcept {
        return m_state->status == PromiseStatus::Fulfilled;
    }

    bool isRejected() const noexcept {
        return m_state->status == PromiseStatus::Rejected;
    }

    PromiseStatus status() const noexcept {
        return m_state->status;
    }

    const R& value() const {
        AGEN_ASSERT(this->isFulfilled(), "value() called on a promise that is not fulfilled");
        return *m_state->value;
    }

    std::exception_ptr error() const {
        AGEN_ASSERT(this->isRejected(), "error() called on a promise that is not rejected");
        return m_state->error;
    }

    /// Registers settlement reactions. They run synchronously when the promise settles,
    /// or right away if it already has. Either callback may be empty.
    void then(
        MoveOnlyFunction<void(const R&)> onFulfill,
        MoveOnlyFunction<void(std::exception_ptr)> onReject = nullptr
    ) const {
        m_state->react({std::move(onFulfill), std::move(onReject)});
    }

private:
    std::shared_ptr<PromiseShared<R>> m_state;
};

/// The settling half. Must be settled at most once; a deferred destroyed while
/// still pending rejects its promise with `AbandonedError`.
template <typename R>
class Deferred {
public:
    explicit Deferred(std::shared_ptr<PromiseShared<R>> state) : m_state(std::move(state)) {}

    Deferred(const Deferred&) = delete;
    Deferred& operator=(const Deferred&) = delete;
    Deferred(Deferred&& other) noexcept = default;

    Deferred& operator=(Deferred&& other) noexcept {
        if (this != &other) {
            this->abandon();
            m_state = std::exchange(other.m_state, nullptr);
        }
        return *this;
    }

    ~Deferred() {
        this->abandon();
    }

    void fulfill(R value) {
        m_state->fulfill(std::move(value));
    }

    void reject(std::exception_ptr error) {
        m_state->reject(std::move(error));
    }

    bool isSettled() const noexcept {
        return !m_state->isPending();
    }

    Promise<R> promise() const {
        return Promise<R>{m_state};
    }

private:
    std::shared_ptr<PromiseShared<R>> m_state;

    void abandon() {
        if (!m_state || !m_state->isPending()) return;

        printWarn("deferred {} dropped before settlement", (void*)m_state.get());
        m_state->reject(std::make_exception_ptr(AbandonedError("deferred dropped before settlement")));
    }
};

/// Creates a new pending deferred. The observable promise is obtained through `promise()`.
template <typename R>
AGEN_NODISCARD Deferred<R> createDeferred() {
    return Deferred<R>{std::make_shared<PromiseShared<R>>()};
}

}
