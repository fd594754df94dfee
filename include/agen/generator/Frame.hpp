#pragma once
#include "Resumption.hpp"
#include <agen/util/Assert.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace agen {

/// Saved execution state of a generator body: a flat arena of local slots, the point at which
/// execution continues, and the resumption the paused expression will observe.
/// The frame is owned by its generator and mutated in place across suspensions.
template <typename T>
class SuspensionFrame {
public:
    explicit SuspensionFrame(size_t slots = 0) : m_slots(slots) {}

    SuspensionFrame(const SuspensionFrame&) = delete;
    SuspensionFrame& operator=(const SuspensionFrame&) = delete;

    /// Snapshots the initial locals at generator start. Grows the arena if needed.
    void capture(std::vector<MaybeValue<T>> initial) {
        AGEN_ASSERT(!m_captured, "suspension frame captured more than once");

        if (initial.size() > m_slots.size()) {
            m_slots.resize(initial.size());
        }

        for (size_t i = 0; i < initial.size(); i++) {
            m_slots[i] = std::move(initial[i]);
        }

        m_captured = true;
    }

    bool isCaptured() const noexcept {
        return m_captured;
    }

    MaybeValue<T>& slot(size_t index) {
        AGEN_ASSERT(index < m_slots.size(), "frame slot index out of range");
        return m_slots[index];
    }

    const MaybeValue<T>& slot(size_t index) const {
        AGEN_ASSERT(index < m_slots.size(), "frame slot index out of range");
        return m_slots[index];
    }

    size_t slotCount() const noexcept {
        return m_slots.size();
    }

    uint32_t resumePoint() const noexcept {
        return m_resumePoint;
    }

    void setResumePoint(uint32_t point) noexcept {
        m_resumePoint = point;
    }

    /// Installs the value or error the paused expression observes. Overwrites an unconsumed one.
    void writeResumptionValue(Resumption<T> resumption) {
        m_resumption = std::move(resumption);
    }

    bool hasResumption() const noexcept {
        return m_resumption.has_value();
    }

    const Resumption<T>& resumption() const {
        AGEN_ASSERT(m_resumption.has_value(), "no resumption value written to the frame");
        return *m_resumption;
    }

    Resumption<T> takeResumption() {
        AGEN_ASSERT(m_resumption.has_value(), "no resumption value written to the frame");
        auto out = std::move(*m_resumption);
        m_resumption.reset();
        return out;
    }

    /// Number of times execution entered the body through this frame.
    size_t entries() const noexcept {
        return m_entries;
    }

    void markEntered() noexcept {
        m_entries++;
    }

private:
    std::vector<MaybeValue<T>> m_slots;
    std::optional<Resumption<T>> m_resumption;
    uint32_t m_resumePoint = 0;
    size_t m_entries = 0;
    bool m_captured = false;
};

}
