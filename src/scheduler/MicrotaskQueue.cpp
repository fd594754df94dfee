#include <agen/scheduler/MicrotaskQueue.hpp>
#include <agen/util/Assert.hpp>
#include <agen/util/Trace.hpp>
#include <utility>

namespace agen {

void MicrotaskQueue::post(Job job) {
    AGEN_ASSERT(static_cast<bool>(job), "posted an empty job");
    m_jobs.push_back(std::move(job));
}

bool MicrotaskQueue::runOne() {
    if (m_jobs.empty()) {
        return false;
    }

    // pop before running, the job may post more jobs
    auto job = std::move(m_jobs.front());
    m_jobs.pop_front();
    m_totalRun++;

    job();
    return true;
}

size_t MicrotaskQueue::runUntilIdle(size_t limit) {
    size_t ran = 0;

    while (ran < limit && this->runOne()) {
        ran++;
    }

    trace("[MicrotaskQueue] ran {} jobs ({} total), {} pending", ran, m_totalRun, m_jobs.size());
    return ran;
}

size_t MicrotaskQueue::pending() const noexcept {
    return m_jobs.size();
}

void MicrotaskQueue::clear() {
    // move out first, destroying a job may release a generator that posts into us
    auto jobs = std::move(m_jobs);
    m_jobs.clear();
    jobs.clear();
}

}
