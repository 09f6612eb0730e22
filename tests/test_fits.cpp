#include "stack_clip/clip/stack_clipper.hpp"
#include "stack_clip/config/configuration.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/io/fits_io.hpp"
#include "stack_clip/io/stack_io.hpp"
#include "stack_clip/stacking/combine.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace stack_clip;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Matrix2Df ramp(int rows, int cols, float offset) {
    Matrix2Df m(rows, cols);
    for (int y = 0; y < rows; ++y)
        for (int x = 0; x < cols; ++x) m(y, x) = offset + static_cast<float>(y * cols + x);
    return m;
}

} // namespace

TEST_CASE("fits_float_round_trip_keeps_orientation_and_header") {
    fs::path dir = fresh_dir("stack_clip_test_fits_rt");
    fs::path p = dir / "img.fits";

    Matrix2Df img = ramp(3, 5, 0.5f);
    io::FitsHeader hdr;
    hdr.set("OBJECT", std::string("M31"));
    hdr.set("EXPTIME", 30.0);
    io::write_fits_float(p, img, hdr);

    auto [back, back_hdr] = io::read_fits_float(p);
    REQUIRE(back.rows() == 3);
    REQUIRE(back.cols() == 5);
    REQUIRE(back(2, 4) == Catch::Approx(14.5f));
    REQUIRE(back_hdr.get_string("OBJECT").value_or("") == "M31");
    REQUIRE(back_hdr.get_double("EXPTIME").value_or(0.0) == Catch::Approx(30.0));

    auto [w, h, naxis] = io::get_fits_dimensions(p);
    REQUIRE(w == 5);
    REQUIRE(h == 3);
    REQUIRE(naxis == 2);

    fs::remove_all(dir);
}

TEST_CASE("read_frame_picks_up_variance_and_mask_extensions") {
    fs::path dir = fresh_dir("stack_clip_test_fits_frame");
    fs::path p = dir / "frame.fits";

    Matrix2Df sci = ramp(2, 3, 1.0f);
    Matrix2Df var = Matrix2Df::Constant(2, 3, 4.0f);
    Matrix2Du16 dq = Matrix2Du16::Zero(2, 3);
    dq(1, 2) = 8;
    io::write_fits_product(p, sci, var, dq, io::FitsHeader());

    auto f = io::read_frame(p, "VAR", "DQ");
    REQUIRE(f.sci(1, 2) == Catch::Approx(6.0f));
    REQUIRE(f.variance.has_value());
    REQUIRE((*f.variance)(0, 0) == Catch::Approx(4.0f));
    REQUIRE(f.mask.has_value());
    REQUIRE((*f.mask)(1, 2) == 8);

    auto bare = io::read_frame(p, "", "");
    REQUIRE_FALSE(bare.variance.has_value());
    REQUIRE_FALSE(bare.mask.has_value());

    fs::remove_all(dir);
}

TEST_CASE("inspect_frame_reports_layout_without_pixels") {
    fs::path dir = fresh_dir("stack_clip_test_fits_inspect");
    fs::path p = dir / "frame.fits";
    io::FitsHeader hdr;
    hdr.set("FILTER", std::string("Ha"));
    io::write_fits_product(p, ramp(4, 6, 0.0f), Matrix2Df::Ones(4, 6), Matrix2Du16::Zero(4, 6), hdr);

    auto layout = io::inspect_frame(p, "VAR", "DQ");
    REQUIRE(layout.rows == 4);
    REQUIRE(layout.cols == 6);
    REQUIRE(layout.has_variance);
    REQUIRE(layout.has_mask);
    REQUIRE(layout.header.get_string("FILTER").value_or("") == "Ha");

    auto bare = io::inspect_frame(p, "", "NOPE");
    REQUIRE_FALSE(bare.has_variance);
    REQUIRE_FALSE(bare.has_mask);

    fs::remove_all(dir);
}

TEST_CASE("load_stack_drops_variance_unless_every_frame_has_it") {
    fs::path dir = fresh_dir("stack_clip_test_fits_partial_var");
    io::write_fits_product(dir / "a.fits", Matrix2Df::Constant(2, 2, 5.0f),
                           Matrix2Df::Constant(2, 2, 2.0f), Matrix2Du16::Zero(2, 2),
                           io::FitsHeader());
    Matrix2Du16 dq = Matrix2Du16::Zero(2, 2);
    dq(0, 0) = 4;
    io::write_fits_product(dir / "b.fits", Matrix2Df::Constant(2, 2, 6.0f),
                           Matrix2Df::Constant(2, 2, 3.0f), dq, io::FitsHeader());
    io::write_fits_float(dir / "c.fits", Matrix2Df::Constant(2, 2, 7.0f), io::FitsHeader());

    config::InputConfig in;
    const std::vector<fs::path> all = {dir / "a.fits", dir / "b.fits", dir / "c.fits"};
    io::StackLoadReport report;
    auto stack = io::load_stack(all, in, &report);
    REQUIRE(report.frames == 3);
    REQUIRE(report.frames_with_variance == 2);
    REQUIRE(report.frames_with_mask == 2);
    REQUIRE_FALSE(report.variance_used);
    REQUIRE_FALSE(stack.has_variance());
    REQUIRE(stack.frame(2)(1, 1) == Catch::Approx(7.0f));
    REQUIRE(stack.frame_mask(1)(0, 0) == 4);

    const std::vector<fs::path> with_var = {dir / "a.fits", dir / "b.fits"};
    auto var_stack = io::load_stack(with_var, in, &report);
    REQUIRE(report.variance_used);
    REQUIRE(var_stack.has_variance());

    fs::remove_all(dir);
}

TEST_CASE("load_clip_combine_write_small_stack") {
    fs::path dir = fresh_dir("stack_clip_test_fits_stack");
    std::vector<fs::path> paths;
    for (int n = 0; n < 5; ++n) {
        Matrix2Df sci = Matrix2Df::Constant(2, 2, 10.0f);
        if (n == 3) sci(0, 1) = 1000.0f;
        fs::path p = dir / ("f" + std::to_string(n) + ".fits");
        io::FitsHeader hdr;
        hdr.set("FRAMENO", n);
        io::write_fits_float(p, sci, hdr);
        paths.push_back(p);
    }

    config::InputConfig in;
    io::StackLoadReport report;
    auto stack = io::load_stack(paths, in, &report);
    REQUIRE(report.frames == 5);
    REQUIRE(report.frames_with_variance == 0);
    REQUIRE_FALSE(report.variance_used);
    REQUIRE(report.reference_header.get_int("FRAMENO").value_or(-1) == 0);
    REQUIRE(stack.num_images() == 5);
    REQUIRE(stack.rows() == 2);
    REQUIRE(stack.cols() == 2);

    auto summary = clip::clip_stack(stack.view(), clip::make_clip_params(1.5, 1.5, 0, true, true));
    REQUIRE(summary.rejected == 1);

    stacking::CombineOptions opts;
    auto combined = stacking::combine_stack(stack.view(), opts);

    fs::path out = dir / "stack.fits";
    io::FitsHeader hdr;
    hdr.set("NCOMBINE", 5);
    io::write_combined(out, combined, stack.rows(), stack.cols(), hdr);

    auto product = io::read_frame(out, "VAR", "DQ");
    REQUIRE(product.sci(0, 1) == Catch::Approx(10.0f));
    REQUIRE(product.variance.has_value());
    REQUIRE(product.mask.has_value());
    REQUIRE(product.header.get_int("NCOMBINE").value_or(0) == 5);

    auto masks = io::write_frame_masks(dir, paths, stack, "_clipmask");
    REQUIRE(masks.size() == 5);
    REQUIRE(masks[3].filename() == "f3_clipmask.fits");
    auto m3 = io::read_frame(masks[3], "", "");
    REQUIRE(m3.sci(0, 1) == Catch::Approx(1.0f));
    REQUIRE(m3.sci(0, 0) == Catch::Approx(0.0f));

    fs::remove_all(dir);
}

TEST_CASE("load_stack_rejects_mismatched_frames") {
    fs::path dir = fresh_dir("stack_clip_test_fits_mismatch");
    io::write_fits_float(dir / "a.fits", Matrix2Df::Zero(2, 2), io::FitsHeader());
    io::write_fits_float(dir / "b.fits", Matrix2Df::Zero(3, 2), io::FitsHeader());

    config::InputConfig in;
    const std::vector<fs::path> paths = {dir / "a.fits", dir / "b.fits"};
    REQUIRE_THROWS_AS(io::load_stack(paths, in), ValidationError);

    fs::remove_all(dir);
}

TEST_CASE("read_missing_fits_throws") {
    REQUIRE_THROWS_AS(io::read_fits_float("/nonexistent/stack_clip.fits"), FitsError);
}
