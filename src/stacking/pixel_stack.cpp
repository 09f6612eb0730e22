#include "stack_clip/stacking/pixel_stack.hpp"
#include "stack_clip/core/errors.hpp"

namespace stack_clip::stacking {

using FrameMap = Eigen::Map<Matrix2Df>;
using ConstFrameMap = Eigen::Map<const Matrix2Df>;
using MaskMap = Eigen::Map<Matrix2Du16>;
using ConstMaskMap = Eigen::Map<const Matrix2Du16>;

PixelStack::PixelStack(int num_images, int rows, int cols, bool with_variance)
    : num_images_(num_images), rows_(rows), cols_(cols),
      has_variance_(with_variance) {
    if (num_images < 0 || rows < 0 || cols < 0) {
        throw ValidationError("stack dimensions must be non-negative");
    }
    const size_t n = static_cast<size_t>(num_images) * pixel_count();
    data_.assign(n, 0.0f);
    mask_.assign(n, 0);
    if (has_variance_) {
        variance_.assign(n, 0.0f);
    }
}

void PixelStack::check_frame(int n, Eigen::Index rows, Eigen::Index cols) const {
    if (n < 0 || n >= num_images_) {
        throw ValidationError("frame index " + std::to_string(n) + " out of range");
    }
    if (rows != rows_ || cols != cols_) {
        throw ValidationError("frame " + std::to_string(n) + " is " +
                              std::to_string(cols) + "x" + std::to_string(rows) +
                              ", stack expects " + std::to_string(cols_) + "x" +
                              std::to_string(rows_));
    }
}

void PixelStack::set_frame(int n, const Matrix2Df& sci) {
    check_frame(n, sci.rows(), sci.cols());
    FrameMap(data_.data() + static_cast<size_t>(n) * pixel_count(), rows_, cols_) = sci;
}

void PixelStack::set_variance(int n, const Matrix2Df& var) {
    if (!has_variance_) {
        throw ValidationError("stack was created without variance");
    }
    check_frame(n, var.rows(), var.cols());
    FrameMap(variance_.data() + static_cast<size_t>(n) * pixel_count(), rows_, cols_) = var;
}

void PixelStack::set_mask(int n, const Matrix2Du16& dq) {
    check_frame(n, dq.rows(), dq.cols());
    MaskMap(mask_.data() + static_cast<size_t>(n) * pixel_count(), rows_, cols_) = dq;
}

Matrix2Df PixelStack::frame(int n) const {
    check_frame(n, rows_, cols_);
    return ConstFrameMap(data_.data() + static_cast<size_t>(n) * pixel_count(), rows_, cols_);
}

Matrix2Du16 PixelStack::frame_mask(int n) const {
    check_frame(n, rows_, cols_);
    return ConstMaskMap(mask_.data() + static_cast<size_t>(n) * pixel_count(), rows_, cols_);
}

clip::StackView PixelStack::view() {
    clip::StackView v;
    v.data = data_.data();
    v.mask = mask_.data();
    v.variance = has_variance_ ? variance_.data() : nullptr;
    v.has_variance = has_variance_;
    v.num_images = num_images_;
    v.pixel_count = pixel_count();
    return v;
}

} // namespace stack_clip::stacking
