#pragma once
#include "Body.hpp"
#include <agen/util/Assert.hpp>
#include <agen/util/ScopeDtor.hpp>
#include <agen/util/Trace.hpp>
#include <cstddef>
#include <exception>
#include <utility>

namespace agen {

/// Runs one step of a generator body and classifies how it ended.
/// Errors escaping the evaluator become `ThrownError` outcomes and never reach the host,
/// except internal assertion failures which are always propagated.
template <typename T>
class ResumptionExecutor {
public:
    explicit ResumptionExecutor(BodyEvaluator<T>& body) : m_body(body) {}

    ResumptionExecutor(const ResumptionExecutor&) = delete;
    ResumptionExecutor& operator=(const ResumptionExecutor&) = delete;

    BodyOutcome<T> resume(SuspensionFrame<T>& frame, Resumption<T> resumption) {
        AGEN_ASSERT(!m_active, "re-entrant execution of a generator body");

        m_active = true;
        auto _guard = scopeDtor([this] { m_active = false; });

        frame.writeResumptionValue(std::move(resumption));
        frame.markEntered();
        m_invocations++;

        try {
            return m_body.resume(frame);
        } catch (const AssertionFailure& e) {
            printError("generator body broke an internal invariant: {}", e.what());
            throw;
        } catch (...) {
            return BodyOutcome<T>::thrown(std::current_exception());
        }
    }

    bool isActive() const noexcept {
        return m_active;
    }

    size_t invocations() const noexcept {
        return m_invocations;
    }

private:
    BodyEvaluator<T>& m_body;
    size_t m_invocations = 0;
    bool m_active = false;
};

}
