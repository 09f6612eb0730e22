#pragma once

#include "stack_clip/clip/sample_buffer.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

namespace stack_clip::clip {

struct ColumnStats {
    double center = 0.0;    // mean or median
    double variance = 0.0;  // population variance of the same samples
    int count = 0;          // samples that entered the statistic
    bool fallback = false;  // no usable unmasked sample; statistic covers all of them
};

// Non-finite values (FITS blanks) never enter a statistic.
inline bool sample_used(float value, uint16_t mask, bool fallback) {
    return (fallback || mask == 0) && std::isfinite(value);
}

// Mean and population variance of the unmasked finite samples.
// When none exists every finite sample of the column is used instead.
ColumnStats masked_mean(const float* values, const uint16_t* mask, int n);

// Exact median of the unmasked samples (two selections for even counts), with
// the population variance of the same set. Same all-masked fallback as
// masked_mean. scratch is reused between calls.
ColumnStats masked_median(const float* values, const uint16_t* mask, int n,
                          std::vector<float>& scratch);

ColumnStats masked_mean(const SampleBuffer& buffer);
ColumnStats masked_median(SampleBuffer& buffer);

} // namespace stack_clip::clip
