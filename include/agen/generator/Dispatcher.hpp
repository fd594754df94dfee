#pragma once
#include "Options.hpp"
#include "Outcome.hpp"
#include "RequestQueue.hpp"
#include "State.hpp"
#include <agen/util/Assert.hpp>
#include <agen/util/Trace.hpp>
#include <cstdint>
#include <exception>
#include <string_view>

namespace agen {

enum class DrainAction : uint8_t {
    /// Keep draining, the head request was settled.
    Continue,
    /// The body suspended on an await; the head request stays queued until it is resumed.
    WaitForAwait,
};

/// Turns body outcomes into settlement of the head request and updates the generator state.
/// The state is updated and the request removed from the queue before its callback runs,
/// so a callback that drives the generator again sees it in its new state.
template <typename T>
class CompletionDispatcher {
public:
    CompletionDispatcher(GeneratorStateMachine& machine, RequestQueue<T>& queue, CompletedRequestPolicy policy, std::string_view name)
        : m_machine(machine), m_queue(queue), m_policy(policy), m_name(name) {}

    CompletionDispatcher(const CompletionDispatcher&) = delete;
    CompletionDispatcher& operator=(const CompletionDispatcher&) = delete;

    DrainAction dispatch(BodyOutcome<T>& outcome) {
        AGEN_ASSERT(m_machine.isExecuting(), "dispatching an outcome while the generator is not executing");
        AGEN_ASSERT(!m_queue.isEmpty(), "dispatching an outcome with no request to settle");

        switch (outcome.kind()) {
            case OutcomeKind::NormalCompletion: {
                m_machine.complete();
                this->fulfillHead(IterResult<T>{std::move(outcome.value()), true});
            } break;

            case OutcomeKind::YieldSignal: {
                m_machine.suspendAtYield();
                this->fulfillHead(IterResult<T>{std::move(outcome.value()), false});
            } break;

            case OutcomeKind::ThrownError: {
                m_machine.complete();
                this->rejectHead(outcome.error());
            } break;

            case OutcomeKind::AwaitSignal: {
                return DrainAction::WaitForAwait;
            } break;
        }

        return DrainAction::Continue;
    }

    /// Settles a return or throw that reached the generator before its body ever ran.
    /// The body is skipped entirely and the generator completes.
    void shortCircuit() {
        AGEN_ASSERT(m_machine.isSuspendedStart(), "start short-circuit on a generator that already started");

        auto& head = m_queue.peekHead();
        AGEN_ASSERT(head.kind() != ResumeKind::Next, "start short-circuit for a next request");

        m_machine.complete();

        if (head.kind() == ResumeKind::Return) {
            auto value = head.resumption().value;
            this->fulfillHead(IterResult<T>{std::move(value), true});
        } else {
            this->rejectHead(head.resumption().error);
        }
    }

    /// Settles the head request of a completed generator without running the body.
    void settleCompleted() {
        AGEN_ASSERT(m_machine.isCompleted(), "completed fast path on a generator that is not completed");

        auto& head = m_queue.peekHead();

        if (m_policy == CompletedRequestPolicy::LanguageRule) {
            switch (head.kind()) {
                case ResumeKind::Next: break;

                case ResumeKind::Return: {
                    auto value = head.resumption().value;
                    this->fulfillHead(IterResult<T>{std::move(value), true});
                } return;

                case ResumeKind::Throw: {
                    this->rejectHead(head.resumption().error);
                } return;
            }
        }

        this->fulfillHead(IterResult<T>{std::nullopt, true});
    }

private:
    GeneratorStateMachine& m_machine;
    RequestQueue<T>& m_queue;
    CompletedRequestPolicy m_policy;
    std::string_view m_name;

    void fulfillHead(IterResult<T> result) {
        auto request = m_queue.popHead();
        trace("[{}] fulfill #{} ({}), done: {}", m_name, request.id(), kindName(request.kind()), result.done);
        this->settle(request.id(), [&] { request.fulfill(std::move(result)); });
    }

    void rejectHead(std::exception_ptr error) {
        auto request = m_queue.popHead();
        trace("[{}] reject #{} ({})", m_name, request.id(), kindName(request.kind()));
        this->settle(request.id(), [&] { request.reject(std::move(error)); });
    }

    /// Runs a settlement callback. A callback that throws is reported and does not stop the drain,
    /// the remaining requests still have to be settled.
    template <typename F>
    void settle(uint64_t id, F&& fn) {
        try {
            fn();
        } catch (const AssertionFailure&) {
            throw;
        } catch (const std::exception& e) {
            printError("[{}] settlement callback for #{} threw: {}", m_name, id, e.what());
        } catch (...) {
            printError("[{}] settlement callback for #{} threw a non-standard exception", m_name, id);
        }
    }
};

}
