#pragma once
#include "Resumption.hpp"
#include <agen/util/Assert.hpp>
#include <agen/util/Error.hpp>
#include <agen/util/Function.hpp>
#include <agen/util/Trace.hpp>
#include <cstdint>
#include <exception>
#include <utility>

namespace agen {

/// One pending driver of a generator: a resumption plus a pair of single-shot completion callbacks.
/// Exactly one of the callbacks runs, exactly once. A request destroyed while still pending is
/// rejected with `AbandonedError`.
template <typename T>
class ResumptionRequest {
public:
    using FulfillFn = MoveOnlyFunction<void(IterResult<T>)>;
    using RejectFn = MoveOnlyFunction<void(std::exception_ptr)>;

    ResumptionRequest(Resumption<T> resumption, FulfillFn onFulfill, RejectFn onReject)
        : m_resumption(std::move(resumption)),
          m_onFulfill(std::move(onFulfill)),
          m_onReject(std::move(onReject)) {}

    ResumptionRequest(const ResumptionRequest&) = delete;
    ResumptionRequest& operator=(const ResumptionRequest&) = delete;

    ResumptionRequest(ResumptionRequest&& other) noexcept
        : m_resumption(std::move(other.m_resumption)),
          m_onFulfill(std::move(other.m_onFulfill)),
          m_onReject(std::move(other.m_onReject)),
          m_id(other.m_id),
          m_settled(std::exchange(other.m_settled, true)) {}

    ResumptionRequest& operator=(ResumptionRequest&& other) {
        if (this != &other) {
            this->abandon();
            m_resumption = std::move(other.m_resumption);
            m_onFulfill = std::move(other.m_onFulfill);
            m_onReject = std::move(other.m_onReject);
            m_id = other.m_id;
            m_settled = std::exchange(other.m_settled, true);
        }
        return *this;
    }

    ~ResumptionRequest() {
        this->abandon();
    }

    const Resumption<T>& resumption() const noexcept {
        return m_resumption;
    }

    ResumeKind kind() const noexcept {
        return m_resumption.kind;
    }

    uint64_t id() const noexcept {
        return m_id;
    }

    void setId(uint64_t id) noexcept {
        m_id = id;
    }

    bool isSettled() const noexcept {
        return m_settled;
    }

    void fulfill(IterResult<T> result) {
        AGEN_ASSERT(!m_settled, "resumption request settled more than once");
        m_settled = true;

        auto callback = std::move(m_onFulfill);
        m_onReject = nullptr;
        if (callback) callback(std::move(result));
    }

    void reject(std::exception_ptr error) {
        AGEN_ASSERT(!m_settled, "resumption request settled more than once");
        m_settled = true;

        auto callback = std::move(m_onReject);
        m_onFulfill = nullptr;
        if (callback) callback(std::move(error));
    }

private:
    Resumption<T> m_resumption;
    FulfillFn m_onFulfill;
    RejectFn m_onReject;
    uint64_t m_id = 0;
    bool m_settled = false;

    void abandon() {
        if (m_settled) return;

        printWarn("resumption request #{} ({}) dropped before settlement", m_id, kindName(m_resumption.kind));
        this->reject(std::make_exception_ptr(AbandonedError("generator abandoned with pending requests")));
    }
};

}
