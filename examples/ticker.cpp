#include <agen/prelude.hpp>
#include <fmt/core.h>
#include <functional>
#include <memory>
#include <stdexcept>

using namespace agen;

// Settles on the next turn of the queue, standing in for a timer.
Promise<MaybeValue<int>> tick(MicrotaskQueue& queue, int n) {
    auto deferred = std::make_shared<Deferred<MaybeValue<int>>>(createDeferred<MaybeValue<int>>());
    auto promise = deferred->promise();

    queue.post([deferred, n] {
        if (n == 3) {
            deferred->reject(std::make_exception_ptr(std::runtime_error("tick 3 was lost")));
        } else {
            deferred->fulfill(n * 100);
        }
    });

    return promise;
}

Body<int> ticker(MicrotaskQueue& queue, int count) {
    for (int i = 0; i < count; i++) {
        try {
            auto value = co_await agen::await(tick(queue, i));
            auto reply = co_yield value;

            if (reply) {
                fmt::print("ticker: consumer replied {}\n", *reply);
            }
        } catch (const std::runtime_error& e) {
            fmt::print("ticker: skipping, {}\n", e.what());
        }
    }

    co_return count;
}

int main() {
    setLogFunction([](std::string msg, LogLevel) {
        fmt::print("{}\n", msg);
    });

    MicrotaskQueue queue;
    auto gen = AsyncGenerator<int>::create(coroutineBody(ticker(queue, 5)), queue, GeneratorOptions{.debugName = "ticker"});

    std::function<void(int)> pull = [&](int reply) {
        gen->next(reply).then(
            [&, reply](const IterResult<int>& result) {
                if (result.done) {
                    fmt::print("main: ticker finished with {}\n", result.value.value_or(-1));
                    return;
                }

                fmt::print("main: got {}\n", result.value.value_or(-1));
                pull(reply + 1);
            },
            [](std::exception_ptr) {
                fmt::print("main: ticker failed\n");
            }
        );
    };

    pull(0);

    size_t jobs = queue.runUntilIdle();
    fmt::print("main: ran {} jobs, generator is {}\n", jobs, gen->state());
}
