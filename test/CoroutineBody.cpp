#include <agen/generator/AsyncGenerator.hpp>
#include <agen/generator/CoroutineBody.hpp>
#include <agen/scheduler/MicrotaskQueue.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace agen;

namespace {

using Gen = AsyncGenerator<int>;

IterResult<int> iter(MaybeValue<int> value, bool done) {
    return IterResult<int>{value, done};
}

Body<int> counter(int limit, std::vector<MaybeValue<int>>& seen) {
    for (int i = 0; i < limit; i++) {
        auto v = co_yield i;
        seen.push_back(v);
    }

    co_return limit * 10;
}

Body<int> resilient(int& caught) {
    for (int i = 0; i < 3; i++) {
        try {
            co_yield i;
        } catch (const std::runtime_error&) {
            caught++;
        }
    }

    co_return 100;
}

struct DropCounter {
    int& drops;

    ~DropCounter() {
        drops++;
    }
};

Body<int> guarded(int& drops, bool& finished) {
    DropCounter guard{drops};
    co_yield 1;
    co_yield 2;
    finished = true;
    co_return 3;
}

Body<int> failing() {
    co_yield 1;
    throw std::logic_error("broken");
}

Body<int> fetcher(Promise<MaybeValue<int>> source) {
    auto v = co_await agen::await(source);
    co_yield v;

    auto w = co_await agen::await(Awaited<int>::ready(*v + 1));
    co_yield w;

    co_return std::nullopt;
}

Body<int> recovering(Promise<MaybeValue<int>> source) {
    bool failed = false;

    try {
        co_await agen::await(source);
    } catch (const std::runtime_error&) {
        failed = true;
    }

    if (failed) {
        co_yield -1;
    }

    co_return 5;
}

}

TEST(CoroutineBody, YieldsAndReturns) {
    MicrotaskQueue queue;
    std::vector<MaybeValue<int>> seen;
    auto gen = Gen::create(coroutineBody(counter(2, seen)), queue);

    EXPECT_EQ(gen->next(99).value(), iter(0, false));
    EXPECT_EQ(gen->next(10).value(), iter(1, false));
    EXPECT_EQ(gen->next(11).value(), iter(20, true));
    EXPECT_EQ(gen->next().value(), iter(std::nullopt, true));

    // the first next() value is never observed by the body
    EXPECT_EQ(seen, (std::vector<MaybeValue<int>>{10, 11}));
}

TEST(CoroutineBody, ThrowCaughtAtYield) {
    MicrotaskQueue queue;
    int caught = 0;
    auto gen = Gen::create(coroutineBody(resilient(caught)), queue);

    EXPECT_EQ(gen->next().value(), iter(0, false));
    EXPECT_EQ(gen->throw_(std::make_exception_ptr(std::runtime_error("a"))).value(), iter(1, false));
    EXPECT_EQ(gen->throw_(std::make_exception_ptr(std::runtime_error("b"))).value(), iter(2, false));
    EXPECT_EQ(gen->next().value(), iter(100, true));
    EXPECT_EQ(caught, 2);
}

TEST(CoroutineBody, UncaughtThrowRejects) {
    MicrotaskQueue queue;
    int caught = 0;
    auto gen = Gen::create(coroutineBody(resilient(caught)), queue);

    EXPECT_EQ(gen->next().value(), iter(0, false));

    // not a runtime_error, escapes the body
    auto p = gen->throw_(std::make_exception_ptr(std::logic_error("fatal")));
    ASSERT_TRUE(p.isRejected());
    EXPECT_THROW(std::rethrow_exception(p.error()), std::logic_error);
    EXPECT_EQ(gen->state(), GeneratorState::Completed);
    EXPECT_EQ(caught, 0);
}

TEST(CoroutineBody, ErrorEscapingBody) {
    MicrotaskQueue queue;
    auto gen = Gen::create(coroutineBody(failing()), queue);

    EXPECT_EQ(gen->next().value(), iter(1, false));

    auto p = gen->next();
    ASSERT_TRUE(p.isRejected());
    EXPECT_THROW(std::rethrow_exception(p.error()), std::logic_error);
    EXPECT_EQ(gen->next().value(), iter(std::nullopt, true));
}

TEST(CoroutineBody, ReturnAtYieldDestroysFrame) {
    MicrotaskQueue queue;
    int drops = 0;
    bool finished = false;
    auto gen = Gen::create(coroutineBody(guarded(drops, finished)), queue);

    EXPECT_EQ(gen->next().value(), iter(1, false));
    EXPECT_EQ(drops, 0);

    EXPECT_EQ(gen->return_(9).value(), iter(9, true));
    EXPECT_EQ(drops, 1);
    EXPECT_FALSE(finished);
    EXPECT_EQ(gen->state(), GeneratorState::Completed);
}

TEST(CoroutineBody, UnstartedBodyIsDestroyed) {
    int drops = 0;
    bool finished = false;

    {
        MicrotaskQueue queue;
        auto gen = Gen::create(coroutineBody(guarded(drops, finished)), queue);
        EXPECT_EQ(gen->return_(4).value(), iter(4, true));
    }

    // the guard was never constructed, the body never started
    EXPECT_EQ(drops, 0);
    EXPECT_FALSE(finished);
}

TEST(CoroutineBody, Await) {
    MicrotaskQueue queue;
    auto d = createDeferred<MaybeValue<int>>();
    auto gen = Gen::create(coroutineBody(fetcher(d.promise())), queue);

    auto p1 = gen->next();
    auto p2 = gen->next();
    auto p3 = gen->next();
    EXPECT_TRUE(gen->isAwaiting());

    d.fulfill(41);
    queue.runUntilIdle();

    EXPECT_EQ(p1.value(), iter(41, false));
    EXPECT_EQ(p2.value(), iter(42, false));
    EXPECT_EQ(p3.value(), iter(std::nullopt, true));
}

TEST(CoroutineBody, AwaitRejectionCaught) {
    MicrotaskQueue queue;
    auto d = createDeferred<MaybeValue<int>>();
    auto gen = Gen::create(coroutineBody(recovering(d.promise())), queue);

    auto p1 = gen->next();
    auto p2 = gen->next();

    d.reject(std::make_exception_ptr(std::runtime_error("unavailable")));
    queue.runUntilIdle();

    EXPECT_EQ(p1.value(), iter(-1, false));
    EXPECT_EQ(p2.value(), iter(5, true));
}

TEST(CoroutineBody, DirectDrive) {
    std::vector<MaybeValue<int>> seen;
    CoroutineBody<int> body{counter(1, seen)};
    SuspensionFrame<int> frame;
    ResumptionExecutor<int> executor{body};

    auto first = executor.resume(frame, Resumption<int>::next());
    ASSERT_TRUE(first.isYield());
    EXPECT_FALSE(body.isFinished());

    auto second = executor.resume(frame, Resumption<int>::next(3));
    ASSERT_TRUE(second.isCompletion());
    EXPECT_EQ(second.value(), 10);
    EXPECT_TRUE(body.isFinished());

    EXPECT_THROW((void)executor.resume(frame, Resumption<int>::next()), AssertionFailure);
}
