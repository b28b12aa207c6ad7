// -----------------------------------------------------------------------------
// Bounded single-producer / single-consumer ring
//
// Hands values from a transport IO thread to the thread that drives poll()
// without locks. Producer and consumer indices live on separate cache lines.
//
//     spsc_ring<std::string, 256> frames;
//     if (!frames.push(std::move(text))) { ... }   // IO thread, full
//     std::string out;
//     while (frames.pop(out)) { ... }              // poll thread
//
// Capacity is a power of two and one slot stays empty, so at most
// Capacity - 1 values are pending at a time.
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>
#include <type_traits>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class spsc_ring {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                  "spsc_ring capacity must be a power of two");

public:
    spsc_ring() noexcept = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side. Returns false (and leaves item untouched) when full.
    [[nodiscard]] inline bool push(T&& item) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const std::size_t write = write_.load(std::memory_order_relaxed);
        const std::size_t after = (write + 1) & MASK;
        if (after == read_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[write] = std::move(item);
        write_.store(after, std::memory_order_release);
        return true;
    }

    // Consumer side. Returns false when nothing is pending.
    [[nodiscard]] inline bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const std::size_t read = read_.load(std::memory_order_relaxed);
        if (read == write_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(slots_[read]);
        read_.store((read + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr std::size_t MASK = Capacity - 1;

    std::array<T, Capacity> slots_{};
    alignas(64) std::atomic<std::size_t> write_{0};
    alignas(64) std::atomic<std::size_t> read_{0};
};

} // namespace lcr::lockfree
