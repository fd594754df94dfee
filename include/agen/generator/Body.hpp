#pragma once
#include "Frame.hpp"
#include "Outcome.hpp"
#include <agen/util/Function.hpp>
#include <utility>

namespace agen {

/// The evaluator that runs a generator body. Each call continues from the frame's
/// continuation point with the resumption written into the frame, and returns how that run ended.
template <typename T>
class BodyEvaluator {
public:
    virtual ~BodyEvaluator() = default;

    virtual BodyOutcome<T> resume(SuspensionFrame<T>& frame) = 0;
};

/// Body written as a step function over the frame. The function keeps its own program
/// counter in `frame.resumePoint()` and its locals in frame slots.
template <typename T>
class FunctionBody : public BodyEvaluator<T> {
public:
    using Step = MoveOnlyFunction<BodyOutcome<T>(SuspensionFrame<T>&)>;

    explicit FunctionBody(Step step) : m_step(std::move(step)) {}

    BodyOutcome<T> resume(SuspensionFrame<T>& frame) override {
        return m_step(frame);
    }

private:
    Step m_step;
};

}
