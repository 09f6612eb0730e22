#pragma once

#include "stack_clip/clip/robust_stats.hpp"
#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/types.hpp"

#include <cstdint>
#include <memory>

namespace stack_clip::clip {

// Inclusive acceptance interval; samples strictly outside are rejected, and so
// is NaN.
struct ClipBounds {
    double low = 0.0;
    double high = 0.0;

    bool rejects(double v) const { return !(v >= low && v <= high); }
};

// center - lsigma * std, center + hsigma * std. An infinite multiplier yields
// an open bound even when std is zero.
ClipBounds compute_bounds(double center, double std, double lsigma, double hsigma);

class RejectionStrategy {
public:
    virtual ~RejectionStrategy() = default;

    virtual BoundsStrategy kind() const = 0;

    // ORs reject_bit into every sample outside its bounds. Never clears a bit.
    // Returns the number of previously unmasked samples that were rejected.
    virtual int reject(SampleBuffer& buffer, const ColumnStats& stats,
                       double lsigma, double hsigma, uint16_t reject_bit) const = 0;
};

// One std from the column scatter, shared by all samples
class SigmaClipRejection final : public RejectionStrategy {
public:
    BoundsStrategy kind() const override { return BoundsStrategy::SIGMA_CLIP; }
    int reject(SampleBuffer& buffer, const ColumnStats& stats,
               double lsigma, double hsigma, uint16_t reject_bit) const override;
};

// Per-sample std from the supplied variance
class VarianceClipRejection final : public RejectionStrategy {
public:
    BoundsStrategy kind() const override { return BoundsStrategy::VARIANCE_CLIP; }
    int reject(SampleBuffer& buffer, const ColumnStats& stats,
               double lsigma, double hsigma, uint16_t reject_bit) const override;
};

// Variance clipping needs a variance array and sigclip off; otherwise sigma clipping.
BoundsStrategy resolve_bounds_strategy(bool has_variance, bool sigclip);

std::unique_ptr<RejectionStrategy> make_rejection_strategy(BoundsStrategy strategy);

} // namespace stack_clip::clip
