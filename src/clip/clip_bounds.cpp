#include "stack_clip/clip/clip_bounds.hpp"
#include "stack_clip/core/errors.hpp"

#include <cmath>
#include <limits>

namespace stack_clip::clip {

ClipBounds compute_bounds(double center, double std, double lsigma, double hsigma) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    ClipBounds b;
    b.low = std::isinf(lsigma) ? -inf : center - lsigma * std;
    b.high = std::isinf(hsigma) ? inf : center + hsigma * std;
    return b;
}

int SigmaClipRejection::reject(SampleBuffer& buffer, const ColumnStats& stats,
                               double lsigma, double hsigma, uint16_t reject_bit) const {
    const double std = std::sqrt(stats.variance);
    const ClipBounds bounds = compute_bounds(stats.center, std, lsigma, hsigma);

    const float* values = buffer.values();
    uint16_t* mask = buffer.mask();
    int rejected = 0;
    for (int n = 0; n < buffer.size(); ++n) {
        if (!bounds.rejects(static_cast<double>(values[n]))) continue;
        if (mask[n] == 0) ++rejected;
        mask[n] |= reject_bit;
    }
    return rejected;
}

int VarianceClipRejection::reject(SampleBuffer& buffer, const ColumnStats& stats,
                                  double lsigma, double hsigma, uint16_t reject_bit) const {
    const float* variance = buffer.variance();
    if (variance == nullptr) {
        throw ValidationError("variance clipping requires a variance array");
    }

    const float* values = buffer.values();
    uint16_t* mask = buffer.mask();
    int rejected = 0;
    for (int n = 0; n < buffer.size(); ++n) {
        const double std = std::sqrt(static_cast<double>(variance[n]));
        const ClipBounds bounds = compute_bounds(stats.center, std, lsigma, hsigma);
        if (!bounds.rejects(static_cast<double>(values[n]))) continue;
        if (mask[n] == 0) ++rejected;
        mask[n] |= reject_bit;
    }
    return rejected;
}

BoundsStrategy resolve_bounds_strategy(bool has_variance, bool sigclip) {
    if (has_variance && !sigclip) {
        return BoundsStrategy::VARIANCE_CLIP;
    }
    return BoundsStrategy::SIGMA_CLIP;
}

std::unique_ptr<RejectionStrategy> make_rejection_strategy(BoundsStrategy strategy) {
    switch (strategy) {
        case BoundsStrategy::VARIANCE_CLIP:
            return std::make_unique<VarianceClipRejection>();
        case BoundsStrategy::SIGMA_CLIP:
        default:
            return std::make_unique<SigmaClipRejection>();
    }
}

} // namespace stack_clip::clip
