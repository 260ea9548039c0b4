#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace objcat {

// Fixed-capacity window of completed ranges waiting for delivery.
//
// Slots form a ring keyed by index % capacity. Only indices in
// [next_index(), next_index() + capacity()) may be stored, so the buffer
// never holds more than capacity() ranges and never holds a range that has
// already been delivered.
class ReorderBuffer {
public:
    explicit ReorderBuffer(uint32_t capacity);

    // Store a completed range. Returns false when the index is outside the
    // window or its slot is already occupied.
    bool put(uint32_t index, std::vector<uint8_t> bytes);

    // Remove and return the range at the delivery cursor, advancing it.
    // Empty when that range has not completed yet.
    std::optional<std::vector<uint8_t>> take_next();

    uint32_t next_index() const { return next_index_; }
    uint32_t capacity() const { return static_cast<uint32_t>(slots_.size()); }
    size_t buffered() const { return buffered_; }
    size_t buffered_bytes() const { return buffered_bytes_; }

    // Drop everything still buffered (abort path)
    void clear();

private:
    std::vector<std::optional<std::vector<uint8_t>>> slots_;
    uint32_t next_index_ = 0;
    size_t buffered_ = 0;
    size_t buffered_bytes_ = 0;
};

} // namespace objcat
