#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/errors.hpp"

#include <algorithm>

namespace stack_clip::clip {

SampleBuffer::SampleBuffer(int capacity) : capacity_(capacity) {
    if (capacity_ < 1) {
        throw ValidationError("sample buffer capacity must be >= 1");
    }
}

void SampleBuffer::reserve(int num_images) {
    if (num_images < 0) {
        throw ValidationError("num_images must be >= 0");
    }
    if (num_images > capacity_) {
        throw CapacityError(num_images, capacity_);
    }
    const size_t n = static_cast<size_t>(num_images);
    values_.resize(n);
    mask_.resize(n);
    variance_.resize(n);
    scratch_.reserve(n);
    size_ = num_images;
}

void SampleBuffer::load(const StackView& stack, size_t pixel) {
    if (stack.num_images != size_) {
        reserve(stack.num_images);
    }
    has_variance_ = stack.has_variance && stack.variance != nullptr;

    const size_t stride = stack.pixel_count;
    size_t offset = pixel;
    for (int n = 0; n < size_; ++n) {
        values_[static_cast<size_t>(n)] = stack.data[offset];
        mask_[static_cast<size_t>(n)] = stack.mask[offset];
        if (has_variance_) {
            variance_[static_cast<size_t>(n)] = stack.variance[offset];
        }
        offset += stride;
    }
}

void SampleBuffer::assign(const std::vector<float>& values,
                          const std::vector<uint16_t>& mask,
                          const std::vector<float>& variance) {
    if (!mask.empty() && mask.size() != values.size()) {
        throw ValidationError("column mask length does not match values");
    }
    if (!variance.empty() && variance.size() != values.size()) {
        throw ValidationError("column variance length does not match values");
    }
    reserve(static_cast<int>(values.size()));
    std::copy(values.begin(), values.end(), values_.begin());
    if (mask.empty()) {
        std::fill(mask_.begin(), mask_.end(), static_cast<uint16_t>(0));
    } else {
        std::copy(mask.begin(), mask.end(), mask_.begin());
    }
    has_variance_ = !variance.empty();
    if (has_variance_) {
        std::copy(variance.begin(), variance.end(), variance_.begin());
    }
}

void SampleBuffer::store_mask(const StackView& stack, size_t pixel) const {
    const size_t stride = stack.pixel_count;
    size_t offset = pixel;
    for (int n = 0; n < size_; ++n) {
        stack.mask[offset] = mask_[static_cast<size_t>(n)];
        offset += stride;
    }
}

int SampleBuffer::count_good() const {
    int ngood = 0;
    for (int n = 0; n < size_; ++n) {
        if (mask_[static_cast<size_t>(n)] == 0) ++ngood;
    }
    return ngood;
}

} // namespace stack_clip::clip
