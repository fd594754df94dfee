#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace agen {

enum class GeneratorState : uint8_t {
    /// Body not yet begun.
    SuspendedStart,
    /// Body running, or suspended on an await on behalf of the head request.
    Executing,
    /// Paused at a yield whose result was already delivered, waiting for the next request.
    AwaitingYield,
    /// Terminal, the body returned or threw.
    Completed,
};

std::string_view stateName(GeneratorState state) noexcept;
bool isValidTransition(GeneratorState from, GeneratorState to) noexcept;

/// Lifecycle of a single generator. `Executing` doubles as the mutual exclusion flag that keeps
/// the body from running twice at once; any transition not in the lifecycle is a protocol violation.
class GeneratorStateMachine {
public:
    explicit GeneratorStateMachine(std::string name = {});

    GeneratorState state() const noexcept;

    bool isSuspendedStart() const noexcept;
    bool isExecuting() const noexcept;
    bool isAwaitingYield() const noexcept;
    bool isCompleted() const noexcept;

    /// SuspendedStart or AwaitingYield -> Executing
    void beginExecution();
    /// Executing -> AwaitingYield
    void suspendAtYield();
    /// Executing -> Completed, or SuspendedStart -> Completed when a return/throw arrives before the body started.
    void complete();

    /// Number of transitions taken so far.
    size_t transitions() const noexcept;

private:
    std::string m_name;
    GeneratorState m_state = GeneratorState::SuspendedStart;
    size_t m_transitions = 0;

    void transitionTo(GeneratorState next);
};

}

template <>
struct fmt::formatter<agen::GeneratorState> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(agen::GeneratorState state, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(agen::stateName(state), ctx);
    }
};
