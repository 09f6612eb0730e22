#pragma once

#include "stack_clip/clip/sample_buffer.hpp"
#include "stack_clip/core/types.hpp"

#include <cstdint>
#include <vector>

namespace stack_clip::stacking {

// Owning, flattened stack of equally sized frames (frame n occupies
// [n * rows * cols, (n + 1) * rows * cols) in each array).
class PixelStack {
public:
    PixelStack() = default;
    PixelStack(int num_images, int rows, int cols, bool with_variance);

    int num_images() const { return num_images_; }
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    size_t pixel_count() const {
        return static_cast<size_t>(rows_) * static_cast<size_t>(cols_);
    }
    bool has_variance() const { return has_variance_; }

    void set_frame(int n, const Matrix2Df& sci);
    void set_variance(int n, const Matrix2Df& var);
    void set_mask(int n, const Matrix2Du16& dq);

    Matrix2Df frame(int n) const;
    Matrix2Du16 frame_mask(int n) const;

    const std::vector<float>& data() const { return data_; }
    const std::vector<float>& variance() const { return variance_; }
    const std::vector<uint16_t>& mask() const { return mask_; }
    std::vector<uint16_t>& mask() { return mask_; }

    clip::StackView view();

private:
    void check_frame(int n, Eigen::Index rows, Eigen::Index cols) const;

    int num_images_ = 0;
    int rows_ = 0;
    int cols_ = 0;
    bool has_variance_ = false;
    std::vector<float> data_;
    std::vector<uint16_t> mask_;
    std::vector<float> variance_;
};

} // namespace stack_clip::stacking
