#include "stack_clip/clip/clip_bounds.hpp"
#include "stack_clip/core/errors.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace stack_clip;
using namespace stack_clip::clip;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
}

TEST_CASE("compute_bounds_is_asymmetric") {
    auto b = compute_bounds(10.0, 2.0, 3.0, 1.0);
    REQUIRE(b.low == Catch::Approx(4.0));
    REQUIRE(b.high == Catch::Approx(12.0));
}

TEST_CASE("bounds_reject_strictly_outside_only") {
    ClipBounds b{4.0, 12.0};
    REQUIRE_FALSE(b.rejects(4.0));
    REQUIRE_FALSE(b.rejects(12.0));
    REQUIRE(b.rejects(3.999));
    REQUIRE(b.rejects(12.001));
    REQUIRE(b.rejects(std::nan("")));
}

TEST_CASE("infinite_multiplier_opens_bound_even_with_zero_std") {
    auto b = compute_bounds(10.0, 0.0, kInf, 2.0);
    REQUIRE(std::isinf(b.low));
    REQUIRE(b.low < 0.0);
    REQUIRE(b.high == Catch::Approx(10.0));
    REQUIRE_FALSE(b.rejects(-1e30));
}

TEST_CASE("sigma_clip_rejects_outlier_with_column_scatter") {
    SampleBuffer buf(8);
    buf.assign({10.0f, 10.0f, 10.0f, 1000.0f, 10.0f}, {});
    auto stats = masked_median(buf);
    // mean 208, population variance 156816 -> std 396
    REQUIRE(std::sqrt(stats.variance) == Catch::Approx(396.0));

    SigmaClipRejection sigma;
    const int n = sigma.reject(buf, stats, 1.5, 1.5, 1);

    REQUIRE(n == 1);
    REQUIRE(buf.mask()[3] == 1);
    REQUIRE(buf.count_good() == 4);
}

TEST_CASE("reject_ors_bit_into_already_masked_samples") {
    SampleBuffer buf(8);
    buf.assign({10.0f, 10.0f, 1000.0f, 10.0f}, {0, 0, 4, 0});
    auto stats = masked_median(buf);
    REQUIRE(stats.variance == 0.0);

    SigmaClipRejection sigma;
    const int n = sigma.reject(buf, stats, 3.0, 3.0, 1);

    // not newly excluded, but the reject bit is recorded
    REQUIRE(n == 0);
    REQUIRE(buf.mask()[2] == 5);
    REQUIRE(buf.mask()[0] == 0);
}

TEST_CASE("reject_uses_configured_bit") {
    SampleBuffer buf(8);
    buf.assign({1.0f, 1.0f, 1.0f, 50.0f}, {});
    auto stats = masked_median(buf);

    SigmaClipRejection sigma;
    sigma.reject(buf, stats, 1.0, 1.0, 0x0100);

    REQUIRE(buf.mask()[3] == 0x0100);
}

TEST_CASE("variance_clip_uses_per_sample_std") {
    SampleBuffer buf(8);
    buf.assign({10.0f, 12.0f, 20.0f, 18.0f}, {}, {1.0f, 1.0f, 1.0f, 16.0f});
    ColumnStats stats;
    stats.center = 12.0;
    stats.count = 4;

    VarianceClipRejection var;
    const int n = var.reject(buf, stats, 3.0, 3.0, 1);

    // 20 is 8 sigma out with std 1; 18 is 1.5 sigma out with std 4
    REQUIRE(n == 1);
    REQUIRE(buf.mask()[2] == 1);
    REQUIRE(buf.mask()[3] == 0);
}

TEST_CASE("variance_clip_without_variance_throws") {
    SampleBuffer buf(4);
    buf.assign({1.0f, 2.0f}, {});
    ColumnStats stats;

    VarianceClipRejection var;
    REQUIRE_THROWS_AS(var.reject(buf, stats, 3.0, 3.0, 1), ValidationError);
}

TEST_CASE("resolve_bounds_strategy_prefers_variance_unless_sigclip") {
    REQUIRE(resolve_bounds_strategy(true, false) == BoundsStrategy::VARIANCE_CLIP);
    REQUIRE(resolve_bounds_strategy(true, true) == BoundsStrategy::SIGMA_CLIP);
    REQUIRE(resolve_bounds_strategy(false, false) == BoundsStrategy::SIGMA_CLIP);
    REQUIRE(resolve_bounds_strategy(false, true) == BoundsStrategy::SIGMA_CLIP);

    REQUIRE(make_rejection_strategy(BoundsStrategy::VARIANCE_CLIP)->kind() ==
            BoundsStrategy::VARIANCE_CLIP);
    REQUIRE(make_rejection_strategy(BoundsStrategy::SIGMA_CLIP)->kind() ==
            BoundsStrategy::SIGMA_CLIP);
}
