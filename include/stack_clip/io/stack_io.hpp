#pragma once

#include "stack_clip/config/configuration.hpp"
#include "stack_clip/io/fits_io.hpp"
#include "stack_clip/stacking/combine.hpp"
#include "stack_clip/stacking/pixel_stack.hpp"

#include <filesystem>
#include <vector>

namespace stack_clip::io {

struct StackLoadReport {
    int frames = 0;
    int frames_with_variance = 0;
    int frames_with_mask = 0;
    bool variance_used = false;
    FitsHeader reference_header;  // header of the first frame
};

// Reads every frame into one flattened stack. All frames must share the first
// frame's shape. Variance is kept only if every frame provides it.
stacking::PixelStack load_stack(const std::vector<fs::path>& paths,
                                const config::InputConfig& cfg,
                                StackLoadReport* report = nullptr);

// Writes combined SCI/VAR/DQ planes shaped rows x cols
void write_combined(const fs::path& path, const stacking::CombineResult& combined,
                    int rows, int cols, const FitsHeader& header);

// One <stem><suffix>.fits per input frame holding that frame's updated mask
std::vector<fs::path> write_frame_masks(const fs::path& out_dir,
                                        const std::vector<fs::path>& inputs,
                                        const stacking::PixelStack& stack,
                                        const std::string& suffix);

} // namespace stack_clip::io
