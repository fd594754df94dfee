#include <agen/generator/State.hpp>
#include <agen/util/Assert.hpp>
#include <agen/util/Trace.hpp>
#include <utility>

namespace agen {

using enum GeneratorState;

std::string_view stateName(GeneratorState state) noexcept {
    switch (state) {
        case SuspendedStart: return "suspended-start";
        case Executing: return "executing";
        case AwaitingYield: return "awaiting-yield";
        case Completed: return "completed";
    }

    return "<invalid>";
}

bool isValidTransition(GeneratorState from, GeneratorState to) noexcept {
    switch (from) {
        case SuspendedStart: return to == Executing || to == Completed;
        case AwaitingYield: return to == Executing;
        case Executing: return to == AwaitingYield || to == Completed;
        case Completed: return false;
    }

    return false;
}

GeneratorStateMachine::GeneratorStateMachine(std::string name) : m_name(std::move(name)) {}

GeneratorState GeneratorStateMachine::state() const noexcept {
    return m_state;
}

bool GeneratorStateMachine::isSuspendedStart() const noexcept {
    return m_state == SuspendedStart;
}

bool GeneratorStateMachine::isExecuting() const noexcept {
    return m_state == Executing;
}

bool GeneratorStateMachine::isAwaitingYield() const noexcept {
    return m_state == AwaitingYield;
}

bool GeneratorStateMachine::isCompleted() const noexcept {
    return m_state == Completed;
}

void GeneratorStateMachine::beginExecution() {
    AGEN_ASSERT(m_state == SuspendedStart || m_state == AwaitingYield, "generator resumed while not suspended");
    this->transitionTo(Executing);
}

void GeneratorStateMachine::suspendAtYield() {
    AGEN_ASSERT(m_state == Executing, "yield reported while the generator is not executing");
    this->transitionTo(AwaitingYield);
}

void GeneratorStateMachine::complete() {
    AGEN_ASSERT(m_state == Executing || m_state == SuspendedStart, "generator completed twice or while suspended at a yield");
    this->transitionTo(Completed);
}

size_t GeneratorStateMachine::transitions() const noexcept {
    return m_transitions;
}

void GeneratorStateMachine::transitionTo(GeneratorState next) {
    AGEN_ASSERT(isValidTransition(m_state, next), "invalid generator state transition");

    trace("[{}] {} -> {}", m_name, m_state, next);
    m_state = next;
    m_transitions++;
}

}
