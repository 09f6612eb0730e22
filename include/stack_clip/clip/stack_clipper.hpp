#pragma once

#include "stack_clip/clip/column_clip.hpp"
#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace stack_clip::clip {

struct ClipRunOptions {
    int workers = 1;
    size_t batch_pixels = 4096;
    // Checked between batches; a set flag ends the call with StopRequested
    const std::atomic<bool>* stop_flag = nullptr;
    std::function<void(size_t done_pixels, size_t total_pixels)> progress;
};

struct ClipSummary {
    size_t pixels = 0;
    size_t converged = 0;
    size_t hit_max_iters = 0;
    uint64_t rejected = 0;  // samples newly excluded by this call
    int max_passes = 0;
    int workers = 1;
    BoundsStrategy bounds = BoundsStrategy::SIGMA_CLIP;
};

// Checks every precondition of clip_stack without touching the stack.
void validate_stack(const StackView& stack, const ClipParams& params);

// Runs the convergence loop over every pixel column and writes each column's
// mask back in place. Validation happens before any mask is written.
ClipSummary clip_stack(const StackView& stack, const ClipParams& params,
                       const ClipRunOptions& options = {});

// Classic kernel signature on raw flattened arrays
ClipSummary iterclip(const float* data, uint16_t* mask, const float* variance,
                     bool has_variance, int num_images, size_t pixel_count,
                     double lsigma, double hsigma, int max_iters, bool mclip,
                     bool sigclip);

// Same, additionally checking that every array holds num_images * pixel_count samples
ClipSummary iterclip(const std::vector<float>& data, std::vector<uint16_t>& mask,
                     const std::vector<float>& variance, bool has_variance,
                     int num_images, size_t pixel_count, double lsigma,
                     double hsigma, int max_iters, bool mclip, bool sigclip);

} // namespace stack_clip::clip
