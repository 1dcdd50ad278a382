#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <new>
#include <optional>
#include <type_traits>

namespace draftlink {

/// Bounded single-producer single-consumer channel with drop-on-full sends
///
/// The producer never blocks: try_send() fails when the channel is full or
/// closed and the caller drops the item. The consumer polls with try_receive()
/// and may look at the head with peek() before committing.
///
/// Thread safety: exactly one thread sends, exactly one (possibly different)
/// thread receives. close() may be called from any thread.
///
/// @tparam T Element type (must be move-constructible)
/// @tparam Capacity Channel capacity (must be a power of 2)
template <typename T, std::size_t Capacity = 1>
class EventChannel {
    static_assert(Capacity > 0, "Capacity must be greater than 0");
    static_assert((Capacity & (Capacity - 1)) == 0,
                  "Capacity must be a power of 2");
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move constructible");

public:
    EventChannel() noexcept {
        for (std::size_t i = 0; i < Capacity; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    ~EventChannel() {
        while (try_receive().has_value()) {}
    }

    // Non-copyable, non-movable (contains atomics)
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;
    EventChannel(EventChannel&&) = delete;
    EventChannel& operator=(EventChannel&&) = delete;

    /// Send without blocking
    /// @return false if the channel is full or closed (item not stored)
    [[nodiscard]] bool try_send(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }

        const std::size_t pos = tail_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos) {
            return false;  // Full
        }

        new (&slot.storage) T(std::move(value));

        slot.sequence.store(pos + 1, std::memory_order_release);
        tail_.store(pos + 1, std::memory_order_relaxed);
        return true;
    }

    /// Receive without blocking
    /// Items sent before close() are still delivered
    [[nodiscard]] std::optional<T> try_receive() noexcept(std::is_nothrow_move_constructible_v<T>) {
        const std::size_t pos = head_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
            return std::nullopt;  // Empty
        }

        T* ptr = std::launder(reinterpret_cast<T*>(&slot.storage));
        std::optional<T> result(std::move(*ptr));
        ptr->~T();

        slot.sequence.store(pos + Capacity, std::memory_order_release);
        head_.store(pos + 1, std::memory_order_relaxed);
        return result;
    }

    /// Look at the oldest item without removing it (consumer only)
    [[nodiscard]] const T* peek() const noexcept {
        const std::size_t pos = head_.load(std::memory_order_relaxed);
        const Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
            return nullptr;
        }
        return std::launder(reinterpret_cast<const T*>(&slot.storage));
    }

    /// Refuse further sends; idempotent
    void close() noexcept {
        closed_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    /// Approximate size (may be slightly stale under concurrent access)
    [[nodiscard]] std::size_t size_approx() const noexcept {
        return tail_.load(std::memory_order_relaxed) - head_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return size_approx() == 0;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity;
    }

private:
    static constexpr std::size_t kMask = Capacity - 1;
    static constexpr std::size_t kCacheLineSize = 64;

    struct Slot {
        std::atomic<std::size_t> sequence;
        alignas(T) std::byte storage[sizeof(T)];
    };

    // Separate cache lines for the two ends
    alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
    alignas(kCacheLineSize) std::atomic<std::size_t> tail_{0};
    alignas(kCacheLineSize) std::atomic<bool> closed_{false};

    std::array<Slot, Capacity> slots_;
};

}  // namespace draftlink
