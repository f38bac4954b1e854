/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity history buffer.
 */

#ifndef AUV_SIM_RING_BUFFER_HPP
#define AUV_SIM_RING_BUFFER_HPP

#include <array>
#include <cstddef>
#include <stdexcept>

namespace auv_sim {

/**
 * @brief Keeps the most recent Capacity values; older ones are overwritten.
 *
 * from_back(0) is the newest element, from_back(size() - 1) the oldest.
 */
template <typename T, size_t Capacity>
class RingBuffer {
    static_assert(Capacity > 0, "RingBuffer capacity must be positive");

public:
    RingBuffer() : head_(0), size_(0) {}

    /// Append a value, dropping the oldest one when full
    void push(const T& value) {
        data_[head_] = value;
        head_ = (head_ + 1) % Capacity;
        if (size_ < Capacity) {
            size_++;
        }
    }

    /// Element i positions before the newest one
    const T& from_back(size_t i) const {
        if (i >= size_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return data_[(head_ + Capacity - 1 - i) % Capacity];
    }

    const T& back() const { return from_back(0); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    std::array<T, Capacity> data_;
    size_t head_;
    size_t size_;
};

}  // namespace auv_sim

#endif  // AUV_SIM_RING_BUFFER_HPP
