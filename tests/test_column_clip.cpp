#include "stack_clip/clip/column_clip.hpp"
#include "stack_clip/core/errors.hpp"

#include <cstdint>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace stack_clip;
using namespace stack_clip::clip;

namespace {

std::vector<uint16_t> mask_of(const SampleBuffer& buf) {
    return std::vector<uint16_t>(buf.mask(), buf.mask() + buf.size());
}

ClipParams sigma_params(double sigma, CenterStrategy center) {
    ClipParams p;
    p.lsigma = sigma;
    p.hsigma = sigma;
    p.center = center;
    p.bounds = BoundsStrategy::SIGMA_CLIP;
    return p;
}

} // namespace

TEST_CASE("single_outlier_is_rejected_and_loop_converges") {
    SampleBuffer buf(16);
    buf.assign({10.0f, 10.0f, 10.0f, 1000.0f, 10.0f}, {});
    ClipParams p = sigma_params(1.5, CenterStrategy::MEDIAN);
    p.max_iters = 5;

    auto r = clip_column(buf, p);

    REQUIRE(r.ngood_initial == 5);
    REQUIRE(r.ngood == 4);
    REQUIRE(r.termination == Termination::CONVERGED);
    REQUIRE(r.passes == 2);
    REQUIRE(r.stats.center == Catch::Approx(10.0));
    REQUIRE(mask_of(buf) == std::vector<uint16_t>{0, 0, 0, 1, 0});
}

TEST_CASE("three_sigma_keeps_single_outlier_in_five_samples") {
    // population scatter puts 1000 only sqrt(5) sigma above the median
    SampleBuffer buf(16);
    buf.assign({10.0f, 10.0f, 10.0f, 1000.0f, 10.0f}, {});

    auto r = clip_column(buf, sigma_params(3.0, CenterStrategy::MEDIAN));

    REQUIRE(r.ngood == 5);
    REQUIRE(r.passes == 1);
    REQUIRE(r.termination == Termination::CONVERGED);
}

TEST_CASE("infinite_bounds_leave_mask_unchanged") {
    const double inf = std::numeric_limits<double>::infinity();
    SampleBuffer buf(16);
    buf.assign({1.0f, 2.0f, 3.0f, 4.0f, 5.0f}, {0, 0, 2, 0, 0});

    auto r = clip_column(buf, sigma_params(inf, CenterStrategy::MEDIAN_THEN_MEAN));

    REQUIRE(r.passes == 1);
    REQUIRE(r.termination == Termination::CONVERGED);
    REQUIRE(r.ngood == 4);
    REQUIRE(mask_of(buf) == std::vector<uint16_t>{0, 0, 2, 0, 0});
}

TEST_CASE("max_iters_caps_the_loop") {
    SampleBuffer buf(16);
    buf.assign({10.0f, 10.0f, 10.0f, 1000.0f, 10.0f}, {});
    ClipParams p = sigma_params(1.5, CenterStrategy::MEDIAN);
    p.max_iters = 1;

    auto r = clip_column(buf, p);

    REQUIRE(r.termination == Termination::MAX_ITERS);
    REQUIRE(r.passes == 1);
    REQUIRE(r.ngood == 4);
}

TEST_CASE("zero_max_iters_selects_default") {
    ClipParams p = make_clip_params(3.0, 3.0, 0, true, false);
    REQUIRE(p.effective_max_iters() == kDefaultMaxIters);
    REQUIRE(kDefaultMaxIters == 100);
    p.max_iters = 7;
    REQUIRE(p.effective_max_iters() == 7);
}

TEST_CASE("make_clip_params_maps_switches") {
    auto a = make_clip_params(2.0, 4.0, 3, true, false);
    REQUIRE(a.center == CenterStrategy::MEDIAN);
    REQUIRE(a.bounds == BoundsStrategy::VARIANCE_CLIP);
    REQUIRE(a.lsigma == 2.0);
    REQUIRE(a.hsigma == 4.0);

    auto b = make_clip_params(3.0, 3.0, 0, false, true);
    REQUIRE(b.center == CenterStrategy::MEDIAN_THEN_MEAN);
    REQUIRE(b.bounds == BoundsStrategy::SIGMA_CLIP);
}

TEST_CASE("validate_clip_params_rejects_bad_values") {
    ClipParams p;
    REQUIRE_NOTHROW(validate_clip_params(p));

    p.lsigma = -1.0;
    REQUIRE_THROWS_AS(validate_clip_params(p), ValidationError);

    p = ClipParams();
    p.hsigma = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(validate_clip_params(p), ValidationError);

    p = ClipParams();
    p.hsigma = std::numeric_limits<double>::infinity();
    REQUIRE_NOTHROW(validate_clip_params(p));

    p = ClipParams();
    p.max_iters = -2;
    REQUIRE_THROWS_AS(validate_clip_params(p), ValidationError);

    p = ClipParams();
    p.reject_bit = 0;
    REQUIRE_THROWS_AS(validate_clip_params(p), ValidationError);
}

TEST_CASE("mask_grows_monotonically_with_more_passes") {
    const std::vector<float> column = {9.8f, 10.1f, 10.0f, 9.9f, 10.2f,
                                       10.05f, 12.0f, 15.0f, 30.0f, 9.95f};
    std::vector<uint16_t> prev(column.size(), 0);
    for (int k = 1; k <= 6; ++k) {
        SampleBuffer buf(16);
        buf.assign(column, {});
        ClipParams p = sigma_params(1.5, CenterStrategy::MEDIAN_THEN_MEAN);
        p.max_iters = k;
        clip_column(buf, p);

        const auto cur = mask_of(buf);
        for (size_t n = 0; n < cur.size(); ++n) {
            REQUIRE((cur[n] & prev[n]) == prev[n]);
        }
        prev = cur;
    }
}

TEST_CASE("rerun_on_converged_mask_changes_nothing") {
    SampleBuffer buf(16);
    buf.assign({9.8f, 10.1f, 10.0f, 9.9f, 10.2f, 10.05f, 12.0f, 15.0f, 30.0f}, {});
    const ClipParams p = sigma_params(2.0, CenterStrategy::MEDIAN);

    auto first = clip_column(buf, p);
    REQUIRE(first.termination == Termination::CONVERGED);
    REQUIRE(first.ngood < first.ngood_initial);
    const auto mask_after_first = mask_of(buf);

    auto second = clip_column(buf, p);
    REQUIRE(second.termination == Termination::CONVERGED);
    REQUIRE(second.passes == 1);
    REQUIRE(second.ngood == first.ngood);
    REQUIRE(mask_of(buf) == mask_after_first);
}

TEST_CASE("variance_clip_median_then_mean") {
    SampleBuffer buf(16);
    buf.assign({10.0f, 11.0f, 9.0f, 10.0f, 50.0f}, {}, {1.0f, 1.0f, 1.0f, 1.0f, 1.0f});
    ClipParams p = make_clip_params(3.0, 3.0, 0, false, false);

    auto r = clip_column(buf, p);

    REQUIRE(r.ngood == 4);
    REQUIRE(r.passes == 2);
    REQUIRE(r.stats.center == Catch::Approx(10.0));
    REQUIRE(mask_of(buf) == std::vector<uint16_t>{0, 0, 0, 0, 1});

    // this column keeps its mask on a rerun
    auto again = clip_column(buf, p);
    REQUIRE(again.passes == 1);
    REQUIRE(again.ngood == 4);
}

TEST_CASE("median_then_mean_rerun_can_reject_more") {
    // pass 0 centers on the median again, which sits lower than the final mean
    SampleBuffer buf(16);
    buf.assign({1.0f, 6.0f, 4.25f, 6.75f, 9.75f, 4.0f}, {}, std::vector<float>(6, 1.0f));
    ClipParams p = make_clip_params(1.5, 1.5, 0, false, false);

    auto first = clip_column(buf, p);
    REQUIRE(first.termination == Termination::CONVERGED);
    REQUIRE(first.ngood == 3);
    REQUIRE(first.stats.center == Catch::Approx(4.75));

    auto second = clip_column(buf, p);
    REQUIRE(second.ngood == 2);
    REQUIRE(buf.mask()[1] == 1);
}

TEST_CASE("nan_sample_is_rejected_without_disturbing_the_column") {
    SampleBuffer buf(16);
    buf.assign({9.0f, 10.0f, 11.0f, 10.5f, 9.5f, std::numeric_limits<float>::quiet_NaN()}, {});

    auto r = clip_column(buf, make_clip_params(3.0, 3.0, 5, true, true));

    REQUIRE(r.termination == Termination::CONVERGED);
    REQUIRE(r.ngood == 5);
    REQUIRE(r.passes == 2);
    REQUIRE(r.stats.center == Catch::Approx(10.0));
    REQUIRE(r.stats.variance == Catch::Approx(0.5));
    REQUIRE(mask_of(buf) == std::vector<uint16_t>{0, 0, 0, 0, 0, 1});
}

TEST_CASE("sigclip_overrides_supplied_variance") {
    const std::vector<float> values = {10.0f, 11.0f, 9.0f, 10.0f, 50.0f};
    const std::vector<float> variance(5, 1000.0f);

    SampleBuffer with_var(16);
    with_var.assign(values, {}, variance);
    auto rv = clip_column(with_var, make_clip_params(2.0, 2.0, 0, true, false));
    REQUIRE(rv.ngood == 5);

    SampleBuffer scatter(16);
    scatter.assign(values, {}, variance);
    auto rs = clip_column(scatter, make_clip_params(2.0, 2.0, 0, true, true));
    REQUIRE(rs.ngood == 4);
    REQUIRE(scatter.mask()[4] == 1);
}

TEST_CASE("variance_clip_without_variance_degrades_to_sigma_clip") {
    SampleBuffer buf(16);
    buf.assign({10.0f, 10.0f, 10.0f, 1000.0f, 10.0f}, {});
    ClipParams p = make_clip_params(1.5, 1.5, 0, true, false);
    REQUIRE(p.bounds == BoundsStrategy::VARIANCE_CLIP);

    auto r = clip_column(buf, p);

    REQUIRE(r.ngood == 4);
}

TEST_CASE("fully_masked_column_converges_immediately") {
    SampleBuffer buf(16);
    buf.assign({1.0f, 2.0f, 3.0f}, {1, 1, 1});

    auto r = clip_column(buf, sigma_params(3.0, CenterStrategy::MEDIAN));

    REQUIRE(r.ngood_initial == 0);
    REQUIRE(r.ngood == 0);
    REQUIRE(r.passes == 1);
    REQUIRE(r.stats.fallback);
}
