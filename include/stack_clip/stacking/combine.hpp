#pragma once

#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stack_clip::stacking {

struct CombineOptions {
    CombineMethod method = CombineMethod::MEAN;
    int workers = 1;
    size_t batch_pixels = 4096;
    int capacity = clip::kDefaultCapacity;
};

struct CombinedPixel {
    float value = 0.0f;
    float variance = 0.0f;
    uint16_t mask = 0;  // OR of the column's bits when nothing survived
    int n_used = 0;
    bool fallback = false;
};

struct CombineResult {
    std::vector<float> data;
    std::vector<float> variance;
    std::vector<uint16_t> mask;
    std::vector<int> n_used;
    size_t fallback_pixels = 0;  // pixels with no usable unmasked sample
};

// Reduces the loaded column to one value using its unmasked samples. With
// external variance the output variance is propagated from it (mean: sum / n^2,
// median: pi/2 times that); otherwise it is the survivors' scatter over n.
CombinedPixel combine_column(clip::SampleBuffer& buffer, CombineMethod method);

// Reads data, mask and variance; writes nothing back into the stack.
CombineResult combine_stack(const clip::StackView& stack, const CombineOptions& options);
CombineResult combine_stack(const clip::StackView& stack, CombineMethod method);

} // namespace stack_clip::stacking
