#pragma once
#include "AwaitScheduler.hpp"
#include <cstddef>
#include <deque>
#include <limits>

namespace agen {

/// Single-threaded cooperative FIFO job queue. Jobs posted while the queue is running
/// are appended and run in the same `runUntilIdle()` call.
class MicrotaskQueue : public AwaitScheduler {
public:
    MicrotaskQueue() = default;

    MicrotaskQueue(const MicrotaskQueue&) = delete;
    MicrotaskQueue& operator=(const MicrotaskQueue&) = delete;
    MicrotaskQueue(MicrotaskQueue&&) = delete;
    MicrotaskQueue& operator=(MicrotaskQueue&&) = delete;

    void post(Job job) override;

    /// Runs the oldest pending job. Returns false if there was nothing to run.
    bool runOne();

    /// Runs jobs until the queue is empty or `limit` jobs have run, returns the number of jobs run.
    size_t runUntilIdle(size_t limit = std::numeric_limits<size_t>::max());

    size_t pending() const noexcept;

    /// Drops all pending jobs without running them.
    void clear();

private:
    std::deque<Job> m_jobs;
    size_t m_totalRun = 0;
};

}
