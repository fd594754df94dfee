#include <agen/prelude.hpp>
#include <fmt/core.h>
#include <stdexcept>
#include <string_view>

using namespace agen;

enum Slot : size_t {
    Total,
    Limit,
};

// Running sum written against the frame directly: locals live in slots,
// and every resumption re-enters at the top.
BodyOutcome<int> accumulate(SuspensionFrame<int>& frame) {
    auto r = frame.takeResumption();

    switch (r.kind) {
        case ResumeKind::Return: return BodyOutcome<int>::complete(r.value);
        case ResumeKind::Throw: return BodyOutcome<int>::thrown(r.error);
        case ResumeKind::Next: break;
    }

    // the value passed to the first next() is not part of the sum
    auto added = frame.resumePoint() > 0 ? r.value.value_or(0) : 0;
    frame.slot(Total) = frame.slot(Total).value_or(0) + added;
    frame.setResumePoint(frame.resumePoint() + 1);

    if (frame.slot(Total).value_or(0) > frame.slot(Limit).value_or(100)) {
        throw std::overflow_error("total exceeded the limit");
    }

    return BodyOutcome<int>::yield(frame.slot(Total));
}

void report(std::string_view what, const Promise<IterResult<int>>& p) {
    if (p.isFulfilled()) {
        auto& r = p.value();
        fmt::print("{}: value {}, done {}\n", what, r.value.value_or(-1), r.done);
    } else if (p.isRejected()) {
        try {
            std::rethrow_exception(p.error());
        } catch (const std::exception& e) {
            fmt::print("{}: rejected, {}\n", what, e.what());
        }
    } else {
        fmt::print("{}: pending\n", what);
    }
}

int main() {
    MicrotaskQueue queue;

    // the first one is closed early with return_()
    auto first = makeGenerator<int>(std::make_unique<FunctionBody<int>>(accumulate), queue, GeneratorOptions{.debugName = "first", .frameSlots = 2});
    report("first next()", first->next());
    report("first next(5)", first->next(5));
    report("first next(7)", first->next(7));
    report("first return(42)", first->return_(42));
    report("first next(1)", first->next(1));

    // the second one gets a limit argument and overflows
    auto second = AsyncGenerator<int>::create(
        std::make_unique<FunctionBody<int>>(accumulate),
        queue,
        GeneratorOptions{.debugName = "second", .frameSlots = 2},
        {0, 10}
    );
    report("second next()", second->next());
    report("second next(6)", second->next(6));
    report("second next(6)", second->next(6));
    report("second next(6)", second->next(6));

    fmt::print("first is {}, second is {}\n", first->state(), second->state());
}
