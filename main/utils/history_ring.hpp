#ifndef HISTORY_RING_HPP
#define HISTORY_RING_HPP

#include <cstddef>
#include <array>

// Fixed-capacity, header-only append log with a bounded retention window.
// - No dynamic allocation (storage is embedded).
// - Entries are only ever appended; once full, the oldest entry drops out.
// - Indexing is chronological: at(0) is the oldest retained entry.
// - No internal locking; the owner serializes access.
template<typename T, std::size_t Capacity>
class HistoryRing {
public:
    static_assert(Capacity > 0, "HistoryRing capacity must be greater than zero");

    HistoryRing() : head_index(0), count(0) {}

    // Returns true if an older entry was evicted to make room
    bool append(const T& value) {
        storage[head_index] = value;
        head_index = (head_index + 1U) % Capacity;
        if (count == Capacity) {
            return true;
        }
        ++count;
        return false;
    }

    const T& at(std::size_t index) const {
        return storage[(oldestIndex() + index) % Capacity];
    }

    const T& back() const {
        return storage[(head_index + Capacity - 1U) % Capacity];
    }

    // Copy the newest n entries (or fewer) into out, oldest first.
    std::size_t copyLatest(std::size_t n, T* out) const {
        std::size_t take = (n < count) ? n : count;
        std::size_t first = count - take;
        for (std::size_t i = 0; i < take; ++i) {
            out[i] = at(first + i);
        }
        return take;
    }

    bool isEmpty() const {
        return count == 0U;
    }

    std::size_t size() const {
        return count;
    }

    void clear() {
        head_index = 0U;
        count = 0U;
    }

private:
    std::size_t oldestIndex() const {
        return (head_index + Capacity - count) % Capacity;
    }

    std::array<T, Capacity> storage;
    std::size_t head_index;
    std::size_t count;
};

#endif // HISTORY_RING_HPP
