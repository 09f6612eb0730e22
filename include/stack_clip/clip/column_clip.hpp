#pragma once

#include "stack_clip/clip/clip_bounds.hpp"
#include "stack_clip/clip/robust_stats.hpp"
#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/types.hpp"

#include <cstdint>

namespace stack_clip::clip {

constexpr int kDefaultMaxIters = 100;
constexpr uint16_t kDefaultRejectBit = 1;

struct ClipParams {
    double lsigma = 3.0;
    double hsigma = 3.0;
    int max_iters = 0;  // 0 => kDefaultMaxIters
    CenterStrategy center = CenterStrategy::MEDIAN;
    // VARIANCE_CLIP degrades to SIGMA_CLIP when no variance is supplied
    BoundsStrategy bounds = BoundsStrategy::VARIANCE_CLIP;
    uint16_t reject_bit = kDefaultRejectBit;
    int capacity = kDefaultCapacity;

    int effective_max_iters() const {
        return max_iters == 0 ? kDefaultMaxIters : max_iters;
    }
};

// Maps the classic mclip/sigclip switches onto the strategy enums
ClipParams make_clip_params(double lsigma, double hsigma, int max_iters,
                            bool mclip, bool sigclip);

// Throws ValidationError for negative or NaN multipliers, negative
// max_iters, a zero reject_bit or a capacity below 1.
void validate_clip_params(const ClipParams& params);

struct ColumnResult {
    int ngood_initial = 0;
    int ngood = 0;
    int passes = 0;  // evaluate/reject passes run; the last one has index passes - 1
    Termination termination = Termination::CONVERGED;
    ColumnStats stats;  // statistic of the final pass
};

// Runs the convergence loop on the loaded column, updating its mask in place.
ColumnResult clip_column(SampleBuffer& buffer, const ClipParams& params,
                         const RejectionStrategy& strategy);

// Same, with the bounds strategy resolved against the buffer's variance
ColumnResult clip_column(SampleBuffer& buffer, const ClipParams& params);

} // namespace stack_clip::clip
