#pragma once
#include "Await.hpp"
#include "Body.hpp"
#include "Dispatcher.hpp"
#include "Executor.hpp"
#include "Frame.hpp"
#include "Options.hpp"
#include "RequestQueue.hpp"
#include "State.hpp"
#include <agen/promise/Deferred.hpp>
#include <agen/scheduler/AwaitScheduler.hpp>
#include <agen/util/Assert.hpp>
#include <agen/util/Config.hpp>
#include <agen/util/ScopeDtor.hpp>
#include <agen/util/Trace.hpp>
#include <fmt/format.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agen {

/// An async generator instance: the lifecycle state, the suspension frame and the queue of
/// pending requests, driven by `next`, `return_` and `throw_`.
///
/// Requests are settled strictly in submission order and the body never runs re-entrantly.
/// A request submitted while the body is executing, from inside a settlement callback,
/// or from inside the body itself, is queued and picked up by the drain loop already running.
///
/// Instances are always owned by a `std::shared_ptr`; an outstanding await keeps its generator
/// alive until the await scheduler runs the continuation. The scheduler must outlive the generator.
template <typename T>
class AsyncGenerator : public std::enable_shared_from_this<AsyncGenerator<T>> {
    struct PrivateTag {};

public:
    using Request = ResumptionRequest<T>;
    using ResultPromise = Promise<IterResult<T>>;

    /// Creates a generator in the suspended-start state. `arguments` are captured into the
    /// first frame slots; the body does not run until the first request is drained.
    static std::shared_ptr<AsyncGenerator> create(
        std::unique_ptr<BodyEvaluator<T>> body,
        AwaitScheduler& scheduler,
        GeneratorOptions options = {},
        std::vector<MaybeValue<T>> arguments = {}
    ) {
        AGEN_ASSERT(body != nullptr, "async generator created without a body");

        auto gen = std::make_shared<AsyncGenerator>(PrivateTag{}, std::move(body), scheduler, std::move(options));
        gen->m_frame.capture(std::move(arguments));

        trace("[{}] created, {} frame slots", gen->m_name, gen->m_frame.slotCount());
        return gen;
    }

    AsyncGenerator(PrivateTag, std::unique_ptr<BodyEvaluator<T>> body, AwaitScheduler& scheduler, GeneratorOptions options)
        : m_name(options.debugName.empty() ? fmt::format("AsyncGenerator @ {}", (void*)this) : std::move(options.debugName)),
          m_policy(options.completedPolicy),
          m_body(std::move(body)),
          m_scheduler(scheduler),
          m_frame(options.frameSlots),
          m_machine(m_name),
          m_executor(*m_body),
          m_dispatcher(m_machine, m_queue, m_policy, m_name) {}

    AsyncGenerator(const AsyncGenerator&) = delete;
    AsyncGenerator& operator=(const AsyncGenerator&) = delete;
    AsyncGenerator(AsyncGenerator&&) = delete;
    AsyncGenerator& operator=(AsyncGenerator&&) = delete;

    ~AsyncGenerator() {
        if (!m_queue.isEmpty()) {
            printWarn("[{}] destroyed with {} pending requests", m_name, m_queue.size());
        }
    }

    ResultPromise next(MaybeValue<T> value = std::nullopt) {
        return this->submit(Resumption<T>::next(std::move(value)));
    }

    ResultPromise return_(MaybeValue<T> value = std::nullopt) {
        return this->submit(Resumption<T>::returning(std::move(value)));
    }

    ResultPromise throw_(std::exception_ptr error) {
        return this->submit(Resumption<T>::throwing(std::move(error)));
    }

    /// Queues a request settled through the given callbacks, and drains the queue if the generator is idle.
    void enqueue(Resumption<T> resumption, typename Request::FulfillFn onFulfill, typename Request::RejectFn onReject) {
        auto kind = resumption.kind;
        auto id = m_queue.enqueue(Request{std::move(resumption), std::move(onFulfill), std::move(onReject)});

        trace("[{}] enqueue #{} ({}), state: {}, queued: {}", m_name, id, kindName(kind), m_machine.state(), m_queue.size());

        this->drain();
    }

    GeneratorState state() const noexcept {
        return m_machine.state();
    }

    size_t queuedRequests() const noexcept {
        return m_queue.size();
    }

    /// Whether the body is suspended on an await whose continuation has not run yet.
    bool isAwaiting() const noexcept {
        return m_awaiting;
    }

    const SuspensionFrame<T>& frame() const noexcept {
        return m_frame;
    }

    /// Number of times the body has been entered, including re-entries after an await.
    size_t bodyInvocations() const noexcept {
        return m_executor.invocations();
    }

    std::string_view debugName() const noexcept {
        return m_name;
    }

    CompletedRequestPolicy completedPolicy() const noexcept {
        return m_policy;
    }

private:
    std::string m_name;
    CompletedRequestPolicy m_policy;
    std::unique_ptr<BodyEvaluator<T>> m_body;
    AwaitScheduler& m_scheduler;
    SuspensionFrame<T> m_frame;
    RequestQueue<T> m_queue;
    GeneratorStateMachine m_machine;
    ResumptionExecutor<T> m_executor;
    CompletionDispatcher<T> m_dispatcher;
    uint64_t m_awaitSeq = 0;
    bool m_awaiting = false;
    bool m_draining = false;

    ResultPromise submit(Resumption<T> resumption) {
        // both callbacks share the deferred, only one of them will ever run
        auto deferred = std::make_shared<Deferred<IterResult<T>>>(createDeferred<IterResult<T>>());
        auto promise = deferred->promise();

        this->enqueue(
            std::move(resumption),
            [deferred](IterResult<T> result) { deferred->fulfill(std::move(result)); },
            [deferred](std::exception_ptr error) { deferred->reject(std::move(error)); }
        );

        return promise;
    }

    void drain() {
        // a drain loop further up the stack will pick up anything queued from here
        if (m_draining) return;

        // a settlement callback may drop the last outside reference
        auto self = this->shared_from_this();

        m_draining = true;
        auto _guard = scopeDtor([this] { m_draining = false; });

        this->drainLoop();
    }

    void drainLoop() {
        while (!m_queue.isEmpty() && !m_machine.isExecuting()) {
            AGEN_DEBUG_ASSERT(!m_executor.isActive(), "drain step while the body is running");

            auto& head = m_queue.peekHead();

            if (m_machine.isCompleted()) {
                m_dispatcher.settleCompleted();
            } else if (m_machine.isSuspendedStart() && head.kind() != ResumeKind::Next) {
                trace("[{}] {} before start, skipping the body", m_name, kindName(head.kind()));
                m_dispatcher.shortCircuit();
            } else {
                auto resumption = head.resumption();
                m_machine.beginExecution();
                this->execute(std::move(resumption));
            }
        }
    }

    void execute(Resumption<T> resumption) {
        auto outcome = m_executor.resume(m_frame, std::move(resumption));
        trace("[{}] body ended with {}", m_name, outcomeName(outcome.kind()));

        if (m_dispatcher.dispatch(outcome) == DrainAction::WaitForAwait) {
            this->registerAwait(std::move(outcome).takeAwaited());
        }
    }

    void registerAwait(Awaited<T> awaited) {
        AGEN_ASSERT(!m_awaiting, "generator registered a second await while one is outstanding");

        m_awaiting = true;
        auto seq = ++m_awaitSeq;
        trace("[{}] awaiting (#{}), {} requests queued", m_name, seq, m_queue.size());

        std::move(awaited).subscribe(m_scheduler, [self = this->shared_from_this(), seq](AwaitResult<T> result) {
            self->onAwaitSettled(seq, std::move(result));
        });
    }

    void onAwaitSettled(uint64_t seq, AwaitResult<T> result) {
        AGEN_ASSERT(m_awaiting && seq == m_awaitSeq, "await continuation ran more than once");
        AGEN_ASSERT(m_machine.isExecuting(), "await continuation ran while the generator is not executing");
        AGEN_ASSERT(!m_draining, "await continuation ran synchronously, it must be posted to the scheduler");

        m_awaiting = false;
        trace("[{}] await #{} settled, {}", m_name, seq, result.isOk() ? "fulfilled" : "rejected");

        m_draining = true;
        auto _guard = scopeDtor([this] { m_draining = false; });

        if (result.isOk()) {
            this->execute(Resumption<T>::next(std::move(result).unwrap()));
        } else {
            this->execute(Resumption<T>::throwing(std::move(result).unwrapErr()));
        }

        this->drainLoop();
    }
};

template <typename T>
std::shared_ptr<AsyncGenerator<T>> makeGenerator(
    std::unique_ptr<BodyEvaluator<T>> body,
    AwaitScheduler& scheduler,
    GeneratorOptions options = {}
) {
    return AsyncGenerator<T>::create(std::move(body), scheduler, std::move(options));
}

}
