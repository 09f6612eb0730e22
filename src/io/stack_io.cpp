#include "stack_clip/io/stack_io.hpp"
#include "stack_clip/core/errors.hpp"

namespace stack_clip::io {

stacking::PixelStack load_stack(const std::vector<fs::path>& paths,
                                const config::InputConfig& cfg,
                                StackLoadReport* report) {
    if (paths.empty()) {
        throw ValidationError("no frames to stack");
    }

    const std::string var_ext = cfg.use_variance ? cfg.variance_extname : std::string();
    const std::string dq_ext = cfg.use_mask ? cfg.mask_extname : std::string();

    // Header pass: shapes and plane presence decide the stack layout
    StackLoadReport local;
    int rows = 0;
    int cols = 0;
    for (const auto& p : paths) {
        FrameLayout layout = inspect_frame(p, var_ext, dq_ext);
        if (local.frames == 0) {
            rows = layout.rows;
            cols = layout.cols;
            local.reference_header = std::move(layout.header);
        } else if (layout.rows != rows || layout.cols != cols) {
            throw ValidationError(p.filename().string() + " is " +
                                  std::to_string(layout.cols) + "x" +
                                  std::to_string(layout.rows) + ", expected " +
                                  std::to_string(cols) + "x" + std::to_string(rows));
        }
        ++local.frames;
        if (layout.has_variance) ++local.frames_with_variance;
        if (layout.has_mask) ++local.frames_with_mask;
    }
    local.variance_used = cfg.use_variance && local.frames_with_variance == local.frames;

    // Pixel pass: one frame in memory at a time
    stacking::PixelStack stack(local.frames, rows, cols, local.variance_used);
    const std::string load_var_ext = local.variance_used ? var_ext : std::string();
    for (int n = 0; n < local.frames; ++n) {
        const FitsFrame f = read_frame(paths[static_cast<size_t>(n)], load_var_ext, dq_ext);
        stack.set_frame(n, f.sci);
        if (local.variance_used) {
            if (!f.variance) {
                throw FitsError(paths[static_cast<size_t>(n)].string() + " lost its " + var_ext +
                                " extension while loading");
            }
            stack.set_variance(n, *f.variance);
        }
        if (f.mask) {
            stack.set_mask(n, *f.mask);
        }
    }

    if (report) {
        *report = std::move(local);
    }
    return stack;
}

void write_combined(const fs::path& path, const stacking::CombineResult& combined,
                    int rows, int cols, const FitsHeader& header) {
    const size_t n = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    if (combined.data.size() != n || combined.variance.size() != n ||
        combined.mask.size() != n) {
        throw ValidationError("combined planes do not match " + std::to_string(cols) +
                              "x" + std::to_string(rows));
    }

    const Matrix2Df sci = Eigen::Map<const Matrix2Df>(combined.data.data(), rows, cols);
    const Matrix2Df var = Eigen::Map<const Matrix2Df>(combined.variance.data(), rows, cols);
    const Matrix2Du16 dq = Eigen::Map<const Matrix2Du16>(combined.mask.data(), rows, cols);
    write_fits_product(path, sci, var, dq, header);
}

std::vector<fs::path> write_frame_masks(const fs::path& out_dir,
                                        const std::vector<fs::path>& inputs,
                                        const stacking::PixelStack& stack,
                                        const std::string& suffix) {
    if (static_cast<int>(inputs.size()) != stack.num_images()) {
        throw ValidationError("mask output needs one input path per frame");
    }

    std::vector<fs::path> written;
    written.reserve(inputs.size());
    for (int n = 0; n < stack.num_images(); ++n) {
        const fs::path& in = inputs[static_cast<size_t>(n)];
        fs::path out = out_dir / (in.stem().string() + suffix + ".fits");
        FitsHeader header;
        header.set("SRCFILE", in.filename().string());
        header.set("FRAMEIDX", n);
        write_fits_mask(out, stack.frame_mask(n), header);
        written.push_back(out);
    }
    return written;
}

} // namespace stack_clip::io
