#pragma once
#include "Body.hpp"
#include <agen/util/Assert.hpp>
#include <agen/util/Config.hpp>
#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

namespace agen {

template <typename T>
class Body;

template <typename T>
class CoroutineBody;

/// Operand of `co_await` inside a coroutine body.
template <typename T>
struct AwaitOperation {
    Awaited<T> awaited;
};

template <typename T>
AwaitOperation<T> await(Awaited<T> awaited) {
    return AwaitOperation<T>{std::move(awaited)};
}

template <typename T>
AwaitOperation<T> await(Promise<MaybeValue<T>> promise) {
    return AwaitOperation<T>{Awaited<T>::promise(std::move(promise))};
}

template <typename T>
struct BodyPromise {
    SuspensionFrame<T>* m_frame = nullptr;
    std::optional<BodyOutcome<T>> m_outcome;

    Body<T> get_return_object() noexcept;

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    template <std::convertible_to<MaybeValue<T>> From>
    void return_value(From&& from) {
        m_outcome = BodyOutcome<T>::complete(MaybeValue<T>(std::forward<From>(from)));
    }

    void unhandled_exception() noexcept {
        m_outcome = BodyOutcome<T>::thrown(std::current_exception());
    }

    struct YieldAwaiter {
        BodyPromise* promise;

        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<>) const noexcept {}

        MaybeValue<T> await_resume() {
            auto resumption = promise->m_frame->takeResumption();
            AGEN_ASSERT(resumption.kind != ResumeKind::Return, "return resumption delivered into a running coroutine body");

            if (resumption.kind == ResumeKind::Throw) {
                std::rethrow_exception(resumption.error);
            }

            return std::move(resumption.value);
        }
    };

    template <std::convertible_to<MaybeValue<T>> From>
    YieldAwaiter yield_value(From&& from) {
        m_outcome = BodyOutcome<T>::yield(MaybeValue<T>(std::forward<From>(from)));
        return YieldAwaiter{this};
    }

    struct AwaitAwaiter {
        BodyPromise* promise;
        std::optional<Awaited<T>> awaited;

        bool await_ready() const noexcept { return false; }

        void await_suspend(std::coroutine_handle<>) {
            promise->m_outcome = BodyOutcome<T>::await(std::move(*awaited));
            awaited.reset();
        }

        MaybeValue<T> await_resume() {
            auto resumption = promise->m_frame->takeResumption();
            AGEN_ASSERT(resumption.kind != ResumeKind::Return, "await resumed with a return resumption");

            if (resumption.kind == ResumeKind::Throw) {
                std::rethrow_exception(resumption.error);
            }

            return std::move(resumption.value);
        }
    };

    AwaitAwaiter await_transform(AwaitOperation<T> op) {
        return AwaitAwaiter{this, std::move(op.awaited)};
    }
};

/// Return type of a C++ coroutine used as a generator body.
///
/// Inside the coroutine, `co_yield v` evaluates to the value passed to the next `next()` call,
/// or rethrows the error passed to `throw_()`. A `return_()` delivered at a yield ends the body
/// there: the coroutine frame is destroyed, running destructors of its locals, and the generator
/// completes with the returned value. `co_await agen::await(x)` suspends until `x` settles and
/// evaluates to its value or rethrows its rejection. Nothing else can be awaited.
///
/// The body ends with `co_return v;`. A body that completes without a value writes
/// `co_return std::nullopt;`, a bare `co_return;` does not compile.
template <typename T>
class AGEN_NODISCARD Body {
public:
    using promise_type = BodyPromise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    explicit Body(handle_type handle) noexcept : m_handle(handle) {}

    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;

    Body(Body&& other) noexcept : m_handle(std::exchange(other.m_handle, {})) {}

    Body& operator=(Body&& other) noexcept {
        if (this != &other) {
            this->destroy();
            m_handle = std::exchange(other.m_handle, {});
        }
        return *this;
    }

    ~Body() {
        this->destroy();
    }

private:
    friend class CoroutineBody<T>;

    handle_type m_handle;

    void destroy() noexcept {
        if (m_handle) {
            m_handle.destroy();
            m_handle = {};
        }
    }
};

template <typename T>
Body<T> BodyPromise<T>::get_return_object() noexcept {
    return Body<T>{Body<T>::handle_type::from_promise(*this)};
}

/// Body evaluator that drives a `Body<T>` coroutine.
template <typename T>
class CoroutineBody : public BodyEvaluator<T> {
public:
    explicit CoroutineBody(Body<T> body) noexcept : m_handle(std::exchange(body.m_handle, {})) {}

    CoroutineBody(const CoroutineBody&) = delete;
    CoroutineBody& operator=(const CoroutineBody&) = delete;

    ~CoroutineBody() override {
        this->destroy();
    }

    BodyOutcome<T> resume(SuspensionFrame<T>& frame) override {
        AGEN_ASSERT(m_handle && !m_handle.done(), "resumed a coroutine body that already finished");

        if (!m_started) {
            // the value passed to the first next() is never observable
            (void)frame.takeResumption();
            m_started = true;
        } else if (m_atYield && frame.resumption().kind == ResumeKind::Return) {
            auto resumption = frame.takeResumption();
            this->destroy();
            return BodyOutcome<T>::complete(std::move(resumption.value));
        }

        auto& promise = m_handle.promise();
        promise.m_frame = &frame;
        promise.m_outcome.reset();

        m_handle.resume();

        AGEN_ASSERT(promise.m_outcome.has_value(), "coroutine body suspended without yielding or awaiting");
        auto outcome = std::move(*promise.m_outcome);
        promise.m_outcome.reset();
        m_atYield = outcome.isYield();

        if (m_handle.done()) {
            this->destroy();
        }

        return outcome;
    }

    bool isFinished() const noexcept {
        return m_started && !m_handle;
    }

private:
    typename Body<T>::handle_type m_handle;
    bool m_started = false;
    bool m_atYield = false;

    void destroy() noexcept {
        if (m_handle) {
            m_handle.destroy();
            m_handle = {};
        }
    }
};

/// Wraps a coroutine into a heap-allocated evaluator, ready to be handed to `AsyncGenerator::create`.
template <typename T>
std::unique_ptr<BodyEvaluator<T>> coroutineBody(Body<T> body) {
    return std::make_unique<CoroutineBody<T>>(std::move(body));
}

}
