#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stack_clip::clip {

// Historic per-column working capacity
constexpr int kDefaultCapacity = 10000;

// Non-owning view over a flattened stack of num_images x pixel_count samples.
// Sample (n, i) lives at n * pixel_count + i. Only mask is ever written.
struct StackView {
    const float* data = nullptr;
    uint16_t* mask = nullptr;
    const float* variance = nullptr;
    bool has_variance = false;
    int num_images = 0;
    size_t pixel_count = 0;

    size_t sample_count() const {
        return static_cast<size_t>(num_images) * pixel_count;
    }
};

// Working copy of one pixel column. A buffer is owned by a single worker and
// reused across the columns it processes.
class SampleBuffer {
public:
    explicit SampleBuffer(int capacity = kDefaultCapacity);

    // Size the buffer for columns of num_images samples.
    // Throws CapacityError if num_images exceeds capacity().
    void reserve(int num_images);

    void load(const StackView& stack, size_t pixel);
    void assign(const std::vector<float>& values,
                const std::vector<uint16_t>& mask,
                const std::vector<float>& variance = {});
    void store_mask(const StackView& stack, size_t pixel) const;

    int size() const { return size_; }
    int capacity() const { return capacity_; }
    bool has_variance() const { return has_variance_; }

    // Samples with no mask bit set
    int count_good() const;

    float* values() { return values_.data(); }
    const float* values() const { return values_.data(); }
    uint16_t* mask() { return mask_.data(); }
    const uint16_t* mask() const { return mask_.data(); }
    const float* variance() const { return has_variance_ ? variance_.data() : nullptr; }

    std::vector<float>& scratch() { return scratch_; }

private:
    int capacity_;
    int size_ = 0;
    bool has_variance_ = false;
    std::vector<float> values_;
    std::vector<uint16_t> mask_;
    std::vector<float> variance_;
    std::vector<float> scratch_;
};

} // namespace stack_clip::clip
