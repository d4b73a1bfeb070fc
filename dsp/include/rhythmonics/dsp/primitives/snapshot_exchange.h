// ==============================================================================
// Layer 1: DSP Primitive - Snapshot Exchange (lock-free triple buffer)
// ==============================================================================
// Single-writer / single-reader handoff of a whole state record between the
// simulation loop and the audio callback.
//
// Three slots rotate between the writer, the reader, and a shared "latest"
// slot. Publishing and acquiring are each a single atomic exchange, so
// neither side ever waits on the other: the audio callback cannot be blocked
// by a slow frame, and a slow audio callback only means intermediate
// snapshots are skipped. The reader always sees a complete record, never a
// mix of two.
//
// Not safe for more than one writer or more than one reader.
// ==============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <type_traits>

namespace Rhythmonics {
namespace DSP {

template <typename T>
class SnapshotExchange {
    static_assert(std::is_trivially_copyable_v<T>,
                  "SnapshotExchange slots are copied wholesale; T must be trivially copyable");

public:
    SnapshotExchange() noexcept = default;

    SnapshotExchange(const SnapshotExchange&) = delete;
    SnapshotExchange& operator=(const SnapshotExchange&) = delete;

    // =========================================================================
    // Writer side
    // =========================================================================

    /// @brief Slot owned by the writer. Contents are stale (two publishes
    ///        old); the writer must fill every field before publish().
    [[nodiscard]] T& writeSlot() noexcept { return slots_[writeIndex_]; }

    /// @brief Make the write slot the latest snapshot.
    void publish() noexcept {
        const std::uint8_t previous = shared_.exchange(
            static_cast<std::uint8_t>(writeIndex_ | kFreshBit), std::memory_order_acq_rel);
        writeIndex_ = previous & kIndexMask;
    }

    /// @brief Copy a record into the write slot and publish it.
    void publish(const T& value) noexcept {
        slots_[writeIndex_] = value;
        publish();
    }

    // =========================================================================
    // Reader side
    // =========================================================================

    /// @brief Take ownership of the latest published snapshot, if any.
    /// @return true if a snapshot newer than the current read slot arrived
    bool acquire() noexcept {
        if ((shared_.load(std::memory_order_acquire) & kFreshBit) == 0) {
            return false;
        }
        const std::uint8_t previous = shared_.exchange(
            static_cast<std::uint8_t>(readIndex_), std::memory_order_acq_rel);
        readIndex_ = previous & kIndexMask;
        return true;
    }

    /// @brief Snapshot owned by the reader (latest acquired).
    [[nodiscard]] const T& readSlot() const noexcept { return slots_[readIndex_]; }

    // =========================================================================
    // Setup (not thread safe, call while neither side is running)
    // =========================================================================

    /// @brief Set every slot to value and mark nothing pending.
    void reset(const T& value) noexcept {
        for (auto& slot : slots_) {
            slot = value;
        }
        writeIndex_ = 0;
        readIndex_ = 1;
        shared_.store(2, std::memory_order_release);
    }

private:
    static constexpr std::uint8_t kIndexMask = 0x03;
    static constexpr std::uint8_t kFreshBit = 0x04;

    std::array<T, 3> slots_{};
    alignas(64) std::uint8_t writeIndex_ = 0;
    alignas(64) std::uint8_t readIndex_ = 1;
    alignas(64) std::atomic<std::uint8_t> shared_{2};
};

} // namespace DSP
} // namespace Rhythmonics
