#include "stack_clip/clip/robust_stats.hpp"
#include "stack_clip/clip/sample_buffer.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace stack_clip::clip;

TEST_CASE("masked_mean_uses_population_variance") {
    const std::vector<float> v = {1.0f, 2.0f, 3.0f, 4.0f};
    const std::vector<uint16_t> m(4, 0);

    auto s = masked_mean(v.data(), m.data(), 4);

    REQUIRE(s.count == 4);
    REQUIRE_FALSE(s.fallback);
    REQUIRE(s.center == Catch::Approx(2.5));
    REQUIRE(s.variance == Catch::Approx(1.25));
}

TEST_CASE("masked_mean_skips_any_nonzero_mask_bit") {
    const std::vector<float> v = {1.0f, 2.0f, 100.0f, -50.0f};
    const std::vector<uint16_t> m = {0, 0, 1, 0x8000};

    auto s = masked_mean(v.data(), m.data(), 4);

    REQUIRE(s.count == 2);
    REQUIRE(s.center == Catch::Approx(1.5));
    REQUIRE(s.variance == Catch::Approx(0.25));
}

TEST_CASE("masked_median_odd_and_even_counts") {
    std::vector<float> scratch;

    const std::vector<float> odd = {5.0f, 1.0f, 3.0f};
    const std::vector<uint16_t> m3(3, 0);
    REQUIRE(masked_median(odd.data(), m3.data(), 3, scratch).center == Catch::Approx(3.0));

    const std::vector<float> even = {4.0f, 1.0f, 3.0f, 2.0f};
    const std::vector<uint16_t> m4(4, 0);
    auto s = masked_median(even.data(), m4.data(), 4, scratch);
    REQUIRE(s.center == Catch::Approx(2.5));
    REQUIRE(s.count == 4);
    // variance belongs to the same sample set as the median
    REQUIRE(s.variance == Catch::Approx(1.25));
}

TEST_CASE("masked_median_ignores_masked_outlier") {
    std::vector<float> scratch;
    const std::vector<float> v = {10.0f, 1000.0f, 12.0f, 11.0f};
    const std::vector<uint16_t> m = {0, 1, 0, 0};

    auto s = masked_median(v.data(), m.data(), 4, scratch);

    REQUIRE(s.count == 3);
    REQUIRE(s.center == Catch::Approx(11.0));
}

TEST_CASE("masked_median_does_not_reorder_input") {
    std::vector<float> scratch;
    const std::vector<float> v = {9.0f, 2.0f, 7.0f, 4.0f, 5.0f};
    const std::vector<float> before = v;
    const std::vector<uint16_t> m(5, 0);

    masked_median(v.data(), m.data(), 5, scratch);

    REQUIRE(v == before);
}

TEST_CASE("all_masked_column_falls_back_to_every_sample") {
    std::vector<float> scratch;
    const std::vector<float> v = {1.0f, 2.0f, 6.0f};
    const std::vector<uint16_t> masked = {1, 2, 4};
    const std::vector<uint16_t> clear(3, 0);

    auto fm = masked_mean(v.data(), masked.data(), 3);
    auto um = masked_mean(v.data(), clear.data(), 3);
    REQUIRE(fm.fallback);
    REQUIRE(fm.count == 3);
    REQUIRE(fm.center == Catch::Approx(um.center));
    REQUIRE(fm.variance == Catch::Approx(um.variance));

    auto fmed = masked_median(v.data(), masked.data(), 3, scratch);
    REQUIRE(fmed.fallback);
    REQUIRE(fmed.center == Catch::Approx(2.0));
}

TEST_CASE("non_finite_samples_stay_out_of_statistics") {
    std::vector<float> scratch;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const std::vector<float> v = {9.0f, nan, 11.0f, 10.0f, std::numeric_limits<float>::infinity()};
    const std::vector<uint16_t> m(5, 0);

    auto mean = masked_mean(v.data(), m.data(), 5);
    REQUIRE(mean.count == 3);
    REQUIRE_FALSE(mean.fallback);
    REQUIRE(mean.center == Catch::Approx(10.0));
    REQUIRE(mean.variance == Catch::Approx(2.0 / 3.0));

    auto med = masked_median(v.data(), m.data(), 5, scratch);
    REQUIRE(med.count == 3);
    REQUIRE(med.center == Catch::Approx(10.0));

    // only blanks unmasked: fall back to the finite masked samples
    const std::vector<uint16_t> blanks_open = {1, 0, 1, 1, 0};
    auto fb = masked_mean(v.data(), blanks_open.data(), 5);
    REQUIRE(fb.fallback);
    REQUIRE(fb.count == 3);
    REQUIRE(std::isfinite(fb.center));
}

TEST_CASE("empty_column_gives_zero_statistic") {
    std::vector<float> scratch;
    auto s = masked_median(nullptr, nullptr, 0, scratch);
    REQUIRE(s.count == 0);
    REQUIRE(s.center == 0.0);
    REQUIRE_FALSE(s.fallback);
}

TEST_CASE("constant_column_has_zero_variance") {
    SampleBuffer buf(16);
    buf.assign({7.0f, 7.0f, 7.0f, 7.0f, 7.0f}, {});

    auto s = masked_mean(buf);

    REQUIRE(s.center == Catch::Approx(7.0));
    REQUIRE(s.variance == 0.0);
}
