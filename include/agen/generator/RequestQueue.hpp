#pragma once
#include "Request.hpp"
#include <agen/util/Assert.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace agen {

/// FIFO of pending resumption requests. Requests are appended at the tail and
/// consumed from the head; nothing ever overtakes an earlier request.
template <typename T>
class RequestQueue {
public:
    RequestQueue() = default;

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    /// Appends a request and returns the sequence number assigned to it.
    uint64_t enqueue(ResumptionRequest<T> request) {
        auto id = ++m_lastId;
        request.setId(id);
        m_requests.push_back(std::move(request));
        return id;
    }

    ResumptionRequest<T>& peekHead() {
        AGEN_ASSERT(!m_requests.empty(), "peekHead() on an empty request queue");
        return m_requests.front();
    }

    ResumptionRequest<T> popHead() {
        AGEN_ASSERT(!m_requests.empty(), "popHead() on an empty request queue");
        auto head = std::move(m_requests.front());
        m_requests.pop_front();
        return head;
    }

    bool isEmpty() const noexcept {
        return m_requests.empty();
    }

    size_t size() const noexcept {
        return m_requests.size();
    }

    /// Sequence number of the most recently enqueued request, 0 if none was ever enqueued.
    uint64_t lastId() const noexcept {
        return m_lastId;
    }

private:
    std::deque<ResumptionRequest<T>> m_requests;
    uint64_t m_lastId = 0;
};

}
