#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded fixed-capacity ring buffer.
//
// Characteristics:
//   • O(1) push/pop operations (no dynamic allocations of its own)
//   • Power-of-two capacity for modulo-free wraparound
//   • FIFO: elements are popped in the order they were pushed
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//   - For cross-thread communication, use lockfree::spsc_ring.
//
// Example:
//   ring_buffer<Item, 256> out;
//   if (!out.push(std::move(item))) { /* full: apply backpressure */ }
//   Item next;
//   while (out.pop(next)) { ... }
//
// Template parameters:
//   T         - element type stored in the buffer
//   Capacity  - must be a power of two and >= 2 (usable slots: Capacity - 1)
//------------------------------------------------------------------------------
template <typename T, size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() = default;
    ~ring_buffer() = default;

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    // Push (copy)
    inline bool push(const T& item) noexcept(std::is_nothrow_copy_assignable_v<T>) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = item;
        head_ = next;
        return true;
    }

    // Push (move)
    inline bool push(T&& item) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = std::move(item);
        head_ = next;
        return true;
    }

    // Pop
    inline bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        if (tail_ == head_) [[unlikely]]
            return false; // empty
        out = std::move(buffer_[tail_]);
        buffer_[tail_] = T{};
        tail_ = (tail_ + 1) & MASK;
        return true;
    }

    // Oldest element (PRECONDITION: !empty())
    inline const T& front() const noexcept {
        return buffer_[tail_];
    }

    inline bool empty() const noexcept { return head_ == tail_; }

    inline bool full() const noexcept {
        return ((head_ + 1) & MASK) == tail_;
    }

    inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    inline size_t size() const noexcept {
        return (head_ - tail_) & MASK;
    }

    inline void clear() {
        while (tail_ != head_) {
            buffer_[tail_] = T{};
            tail_ = (tail_ + 1) & MASK;
        }
        head_ = tail_ = 0;
    }

private:
    static constexpr size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    size_t head_{0};
    size_t tail_{0};
};


} // namespace local
} // namespace lcr
