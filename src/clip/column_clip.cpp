#include "stack_clip/clip/column_clip.hpp"
#include "stack_clip/core/errors.hpp"

#include <cmath>

namespace stack_clip::clip {

ClipParams make_clip_params(double lsigma, double hsigma, int max_iters,
                            bool mclip, bool sigclip) {
    ClipParams p;
    p.lsigma = lsigma;
    p.hsigma = hsigma;
    p.max_iters = max_iters;
    p.center = mclip ? CenterStrategy::MEDIAN : CenterStrategy::MEDIAN_THEN_MEAN;
    p.bounds = sigclip ? BoundsStrategy::SIGMA_CLIP : BoundsStrategy::VARIANCE_CLIP;
    return p;
}

void validate_clip_params(const ClipParams& params) {
    if (std::isnan(params.lsigma) || params.lsigma < 0.0) {
        throw ValidationError("lsigma must be >= 0");
    }
    if (std::isnan(params.hsigma) || params.hsigma < 0.0) {
        throw ValidationError("hsigma must be >= 0");
    }
    if (params.max_iters < 0) {
        throw ValidationError("max_iters must be >= 0 (0 selects the default)");
    }
    if (params.reject_bit == 0) {
        throw ValidationError("reject_bit must be non-zero");
    }
    if (params.capacity < 1) {
        throw ValidationError("capacity must be >= 1");
    }
}

ColumnResult clip_column(SampleBuffer& buffer, const ClipParams& params,
                         const RejectionStrategy& strategy) {
    ColumnResult result;
    const int max_iters = params.effective_max_iters();

    int ngood = buffer.count_good();
    result.ngood_initial = ngood;

    int iter = 0;
    while (true) {
        const bool use_median =
            params.center == CenterStrategy::MEDIAN || iter == 0;
        result.stats = use_median ? masked_median(buffer) : masked_mean(buffer);

        strategy.reject(buffer, result.stats, params.lsigma, params.hsigma,
                        params.reject_bit);
        const int new_ngood = buffer.count_good();
        ++iter;

        if (new_ngood == ngood) {
            result.termination = Termination::CONVERGED;
            break;
        }
        ngood = new_ngood;
        if (iter >= max_iters) {
            result.termination = Termination::MAX_ITERS;
            break;
        }
    }

    result.ngood = ngood;
    result.passes = iter;
    return result;
}

ColumnResult clip_column(SampleBuffer& buffer, const ClipParams& params) {
    const bool sigclip = params.bounds == BoundsStrategy::SIGMA_CLIP;
    const BoundsStrategy resolved =
        resolve_bounds_strategy(buffer.has_variance(), sigclip);
    const auto strategy = make_rejection_strategy(resolved);
    return clip_column(buffer, params, *strategy);
}

} // namespace stack_clip::clip
