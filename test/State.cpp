#include <agen/generator/State.hpp>
#include <agen/util/Assert.hpp>
#include <gtest/gtest.h>
#include <fmt/format.h>

using namespace agen;
using enum GeneratorState;

TEST(State, Lifecycle) {
    GeneratorStateMachine machine{"lifecycle"};
    EXPECT_TRUE(machine.isSuspendedStart());

    machine.beginExecution();
    EXPECT_TRUE(machine.isExecuting());

    machine.suspendAtYield();
    EXPECT_TRUE(machine.isAwaitingYield());

    machine.beginExecution();
    machine.complete();
    EXPECT_TRUE(machine.isCompleted());
    EXPECT_EQ(machine.transitions(), 4);
}

TEST(State, CompleteBeforeStart) {
    GeneratorStateMachine machine;
    machine.complete();
    EXPECT_EQ(machine.state(), Completed);
}

TEST(State, InvalidTransitions) {
    GeneratorStateMachine machine;
    EXPECT_THROW(machine.suspendAtYield(), AssertionFailure);

    machine.beginExecution();
    EXPECT_THROW(machine.beginExecution(), AssertionFailure);

    machine.suspendAtYield();
    EXPECT_THROW(machine.complete(), AssertionFailure);
    EXPECT_THROW(machine.suspendAtYield(), AssertionFailure);

    machine.beginExecution();
    machine.complete();
    EXPECT_THROW(machine.beginExecution(), AssertionFailure);
    EXPECT_THROW(machine.complete(), AssertionFailure);

    // failed transitions leave the state untouched
    EXPECT_EQ(machine.state(), Completed);
    EXPECT_EQ(machine.transitions(), 4);
}

TEST(State, TransitionTable) {
    EXPECT_TRUE(isValidTransition(SuspendedStart, Executing));
    EXPECT_TRUE(isValidTransition(SuspendedStart, Completed));
    EXPECT_TRUE(isValidTransition(Executing, AwaitingYield));
    EXPECT_TRUE(isValidTransition(Executing, Completed));
    EXPECT_TRUE(isValidTransition(AwaitingYield, Executing));

    EXPECT_FALSE(isValidTransition(SuspendedStart, AwaitingYield));
    EXPECT_FALSE(isValidTransition(AwaitingYield, Completed));
    EXPECT_FALSE(isValidTransition(Executing, Executing));

    for (auto to : {SuspendedStart, Executing, AwaitingYield, Completed}) {
        EXPECT_FALSE(isValidTransition(Completed, to));
    }
}

TEST(State, Format) {
    EXPECT_EQ(fmt::format("{}", AwaitingYield), "awaiting-yield");
    EXPECT_EQ(stateName(SuspendedStart), "suspended-start");
}
