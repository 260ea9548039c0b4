#include "objcat/cat/reorder_buffer.hpp"

#include <stdexcept>
#include <utility>

namespace objcat {

ReorderBuffer::ReorderBuffer(uint32_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("reorder buffer capacity must be positive");
    }
    slots_.resize(capacity);
}

bool ReorderBuffer::put(uint32_t index, std::vector<uint8_t> bytes) {
    if (index < next_index_ || index - next_index_ >= capacity()) {
        return false;
    }
    auto& slot = slots_[index % capacity()];
    if (slot) {
        return false;
    }
    buffered_bytes_ += bytes.size();
    slot = std::move(bytes);
    buffered_++;
    return true;
}

std::optional<std::vector<uint8_t>> ReorderBuffer::take_next() {
    auto& slot = slots_[next_index_ % capacity()];
    if (!slot) {
        return std::nullopt;
    }
    std::optional<std::vector<uint8_t>> bytes = std::move(slot);
    slot.reset();
    buffered_--;
    buffered_bytes_ -= bytes->size();
    next_index_++;
    return bytes;
}

void ReorderBuffer::clear() {
    for (auto& slot : slots_) {
        slot.reset();
    }
    buffered_ = 0;
    buffered_bytes_ = 0;
}

} // namespace objcat
