#pragma once
// ==============================================================================
// Allocation Detector
// ==============================================================================
// Detects heap allocations during test execution.
// Used to verify real-time safety of the audio and tick paths.
//
// The counter only sees allocations once global operator new is routed to it.
// Exactly one test translation unit does that by defining
// RHYTHMONICS_DEFINE_ALLOCATION_HOOKS before including this header.
//
// IMPORTANT: This is a simplified detector for testing purposes.
// In production, use platform-specific tools like Valgrind or heaptrack.
// ==============================================================================

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <new>

namespace TestHelpers {

// ==============================================================================
// Allocation Tracking
// ==============================================================================
// Thread-safe counter for tracking allocations

class AllocationDetector {
public:
    AllocationDetector() = default;

    // Start tracking allocations
    void startTracking() {
        allocationCount_.store(0, std::memory_order_relaxed);
        tracking_.store(true, std::memory_order_release);
    }

    // Stop tracking and return count
    size_t stopTracking() {
        tracking_.store(false, std::memory_order_release);
        return allocationCount_.load(std::memory_order_acquire);
    }

    bool isTracking() const {
        return tracking_.load(std::memory_order_acquire);
    }

    // Record an allocation (called by the operator new hooks)
    void recordAllocation() {
        if (tracking_.load(std::memory_order_acquire)) {
            allocationCount_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static AllocationDetector& instance() {
        static AllocationDetector detector;
        return detector;
    }

private:
    std::atomic<bool> tracking_{false};
    std::atomic<size_t> allocationCount_{0};
};

// ==============================================================================
// RAII Tracking Scope
// ==============================================================================

class AllocationScope {
public:
    AllocationScope() {
        AllocationDetector::instance().startTracking();
    }

    ~AllocationScope() {
        stop();
    }

    // Stop early so the count can be checked inside the scope
    size_t stop() {
        if (!stopped_) {
            count_ = AllocationDetector::instance().stopTracking();
            stopped_ = true;
        }
        return count_;
    }

    size_t getAllocationCount() const {
        return count_;
    }

private:
    size_t count_ = 0;
    bool stopped_ = false;
};

} // namespace TestHelpers

// ==============================================================================
// Global Operator Overrides
// ==============================================================================

#ifdef RHYTHMONICS_DEFINE_ALLOCATION_HOOKS

void* operator new(std::size_t size) {
    TestHelpers::AllocationDetector::instance().recordAllocation();
    void* p = std::malloc(size == 0 ? 1 : size);
    if (!p) throw std::bad_alloc();
    return p;
}

void* operator new[](std::size_t size) {
    TestHelpers::AllocationDetector::instance().recordAllocation();
    void* p = std::malloc(size == 0 ? 1 : size);
    if (!p) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept {
    std::free(p);
}

void operator delete[](void* p) noexcept {
    std::free(p);
}

void operator delete(void* p, std::size_t) noexcept {
    std::free(p);
}

void operator delete[](void* p, std::size_t) noexcept {
    std::free(p);
}

#endif // RHYTHMONICS_DEFINE_ALLOCATION_HOOKS
