#include "runner_pipeline.hpp"

#include "stack_clip/clip/stack_clipper.hpp"
#include "stack_clip/config/configuration.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/core/events.hpp"
#include "stack_clip/core/types.hpp"
#include "stack_clip/core/utils.hpp"
#include "stack_clip/io/fits_io.hpp"
#include "stack_clip/io/stack_io.hpp"
#include "stack_clip/stacking/combine.hpp"

#include "runner_shared.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
using stack_clip::Phase;
using stack_clip::runner::TeeBuf;
using stack_clip::runner::estimate_total_file_bytes;
using stack_clip::runner::format_bytes;

double seconds_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
      .count();
}
} // namespace

int run_clip_command(const RunOptions &opts) {
  using namespace stack_clip;

  fs::path in_dir(opts.input_dir);
  fs::path runs(opts.runs_dir);
  const bool use_stdin_config =
      opts.config_from_stdin || (opts.config_path == "-");

  if (!fs::exists(in_dir)) {
    std::cerr << "Error: Input directory not found: " << opts.input_dir
              << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    if (use_stdin_config) {
      std::ostringstream ss;
      ss << std::cin.rdbuf();
      const std::string cfg_text = ss.str();
      if (cfg_text.empty()) {
        std::cerr << "Error: --stdin provided but no config YAML received"
                  << std::endl;
        return 1;
      }
      cfg = config::Config::from_yaml(YAML::Load(cfg_text));
    } else {
      cfg = config::Config::load(opts.config_path);
    }
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  auto frames = core::discover_frames(in_dir, cfg.input.pattern);
  frames.erase(std::remove_if(frames.begin(), frames.end(),
                              [](const fs::path &p) {
                                return !io::is_fits_image_path(p);
                              }),
               frames.end());
  const int max_frames =
      opts.max_frames > 0 ? opts.max_frames : cfg.input.max_frames;
  if (max_frames > 0 && frames.size() > static_cast<size_t>(max_frames)) {
    frames.resize(static_cast<size_t>(max_frames));
  }
  if (frames.empty()) {
    std::cerr << "Error: No FITS frames found in " << opts.input_dir
              << std::endl;
    return 1;
  }

  const std::string run_id =
      opts.run_id_override.empty() ? core::get_run_id() : opts.run_id_override;
  fs::path run_dir = fs::absolute(runs / run_id);
  try {
    fs::create_directories(run_dir / "logs");
    fs::create_directories(run_dir / "outputs");
    cfg.save(run_dir / "config.yaml");
  } catch (const std::exception &e) {
    std::cerr << "Error: Cannot prepare run directory " << run_dir << ": "
              << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::app);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: Cannot open event log "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", use_stdin_config ? "<stdin>" : opts.config_path},
                     {"input_dir", fs::absolute(in_dir).string()},
                     {"run_dir", run_dir.string()},
                     {"frames_discovered", frames.size()}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Frames: " << frames.size() << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  auto fail = [&](Phase phase, const std::string &status,
                  const std::string &message) {
    emitter.error(run_id, message, log_file);
    emitter.phase_end(run_id, phase, status, {{"error", message}}, log_file);
    emitter.run_end(run_id, false, status, log_file);
    std::cerr << "Error during " << phase_to_string(phase) << ": " << message
              << std::endl;
    return 1;
  };

  // SCAN_INPUT
  emitter.phase_start(run_id, Phase::SCAN_INPUT, log_file);
  int width = 0;
  int height = 0;
  try {
    auto [w, h, naxis] = io::get_fits_dimensions(frames.front());
    width = w;
    height = h;
    if (naxis > 2) {
      emitter.warning(run_id,
                      frames.front().filename().string() +
                          " has NAXIS > 2; only the first plane is stacked",
                      log_file);
    }
  } catch (const std::exception &e) {
    // primary HDU may be header-only; LOAD_STACK finds the image extension
    emitter.warning(run_id, e.what(), log_file);
  }
  const uint64_t input_bytes = estimate_total_file_bytes(frames);
  std::cout << "[SCAN_INPUT] " << frames.size() << " frames, "
            << format_bytes(input_bytes) << std::endl;
  emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                    {{"frames", frames.size()},
                     {"width", width},
                     {"height", height},
                     {"input_bytes", input_bytes}},
                    log_file);

  if (opts.dry_run) {
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  // LOAD_STACK
  emitter.phase_start(run_id, Phase::LOAD_STACK, log_file);
  auto t0 = std::chrono::steady_clock::now();
  stacking::PixelStack stack;
  io::StackLoadReport load_report;
  try {
    stack = io::load_stack(frames, cfg.input, &load_report);
  } catch (const std::exception &e) {
    return fail(Phase::LOAD_STACK, "error", e.what());
  }
  if (cfg.input.use_variance && load_report.frames_with_variance > 0 &&
      !load_report.variance_used) {
    emitter.warning(run_id,
                    std::to_string(load_report.frames_with_variance) + "/" +
                        std::to_string(load_report.frames) + " frames carry " +
                        cfg.input.variance_extname +
                        "; variance ignored, clipping on pixel scatter",
                    log_file);
  }
  std::cout << "[LOAD_STACK] " << stack.num_images() << " x " << stack.cols()
            << "x" << stack.rows() << " in " << seconds_since(t0) << " s"
            << std::endl;
  emitter.phase_end(run_id, Phase::LOAD_STACK, "ok",
                    {{"frames", load_report.frames},
                     {"width", stack.cols()},
                     {"height", stack.rows()},
                     {"frames_with_variance", load_report.frames_with_variance},
                     {"frames_with_mask", load_report.frames_with_mask},
                     {"variance_used", load_report.variance_used}},
                    log_file);

  // CLIP
  emitter.phase_start(run_id, Phase::CLIP, log_file);
  t0 = std::chrono::steady_clock::now();
  const clip::ClipParams params = cfg.clip_params();
  clip::ClipRunOptions clip_opts;
  clip_opts.workers = cfg.runtime.parallel_workers;
  clip_opts.batch_pixels = static_cast<size_t>(cfg.runtime.batch_pixels);
  clip_opts.stop_flag = opts.stop_flag;
  size_t last_reported = 0;
  clip_opts.progress = [&](size_t done, size_t total) {
    // called under the clipper's progress lock
    const size_t step = std::max<size_t>(1, total / 20);
    if (done - last_reported < step && done != total) {
      return;
    }
    last_reported = done;
    const float p = total == 0 ? 1.0f
                               : static_cast<float>(done) /
                                     static_cast<float>(total);
    emitter.phase_progress(run_id, Phase::CLIP, p,
                           "clip " + std::to_string(done) + "/" +
                               std::to_string(total),
                           log_file);
  };

  clip::ClipSummary summary;
  try {
    summary = clip::clip_stack(stack.view(), params, clip_opts);
  } catch (const StopRequested &e) {
    return fail(Phase::CLIP, "stopped", e.what());
  } catch (const std::exception &e) {
    return fail(Phase::CLIP, "error", e.what());
  }
  std::cout << "[CLIP] " << summary.pixels << " pixels, "
            << summary.rejected << " samples rejected, "
            << summary.hit_max_iters << " columns at max_iters, workers="
            << summary.workers << " (" << seconds_since(t0) << " s)"
            << std::endl;
  emitter.phase_end(run_id, Phase::CLIP, "ok",
                    {{"pixels", summary.pixels},
                     {"rejected_samples", summary.rejected},
                     {"converged", summary.converged},
                     {"hit_max_iters", summary.hit_max_iters},
                     {"max_passes", summary.max_passes},
                     {"workers", summary.workers},
                     {"center", center_strategy_to_string(params.center)},
                     {"bounds", bounds_strategy_to_string(summary.bounds)}},
                    log_file);

  // COMBINE
  emitter.phase_start(run_id, Phase::COMBINE, log_file);
  t0 = std::chrono::steady_clock::now();
  stacking::CombineResult combined;
  try {
    stacking::CombineOptions comb_opts;
    comb_opts.method = cfg.combine_method();
    comb_opts.workers = cfg.runtime.parallel_workers;
    comb_opts.batch_pixels = static_cast<size_t>(cfg.runtime.batch_pixels);
    comb_opts.capacity = cfg.clip.capacity;
    combined = stacking::combine_stack(stack.view(), comb_opts);
  } catch (const std::exception &e) {
    return fail(Phase::COMBINE, "error", e.what());
  }
  if (combined.fallback_pixels > 0) {
    emitter.warning(run_id,
                    std::to_string(combined.fallback_pixels) +
                        " pixels had no unmasked sample; combined from all samples",
                    log_file);
  }
  std::cout << "[COMBINE] " << cfg.combine.method << " in "
            << seconds_since(t0) << " s" << std::endl;
  emitter.phase_end(run_id, Phase::COMBINE, "ok",
                    {{"method", cfg.combine.method},
                     {"fallback_pixels", combined.fallback_pixels}},
                    log_file);

  // WRITE_OUTPUT
  emitter.phase_start(run_id, Phase::WRITE_OUTPUT, log_file);
  const fs::path out_dir = run_dir / "outputs";
  const fs::path combined_path = out_dir / cfg.output.combined_file;
  std::vector<fs::path> mask_paths;
  try {
    io::FitsHeader header = load_report.reference_header;
    header.set("NCOMBINE", stack.num_images());
    header.set("COMBMETH", cfg.combine.method);
    header.set("CLIPLSIG", params.lsigma);
    header.set("CLIPHSIG", params.hsigma);
    header.set("CLIPITER", params.effective_max_iters());
    header.set("CLIPCENT", center_strategy_to_string(params.center));
    header.set("CLIPBND", bounds_strategy_to_string(summary.bounds));
    header.set("CLIPREJ", static_cast<double>(summary.rejected));
    io::write_combined(combined_path, combined, stack.rows(), stack.cols(),
                       header);
    if (cfg.output.write_masks) {
      mask_paths = io::write_frame_masks(out_dir, frames, stack,
                                         cfg.output.mask_suffix);
    }
  } catch (const std::exception &e) {
    return fail(Phase::WRITE_OUTPUT, "error", e.what());
  }
  core::json masks_json = core::json::array();
  for (const auto &p : mask_paths) {
    masks_json.push_back(p.filename().string());
  }
  std::cout << "[WRITE_OUTPUT] " << combined_path.string() << std::endl;
  emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok",
                    {{"combined_file", combined_path.string()},
                     {"mask_files", masks_json}},
                    log_file);

  emitter.phase_start(run_id, Phase::DONE, log_file);
  emitter.phase_end(run_id, Phase::DONE, "ok",
                    {{"run_dir", run_dir.string()}}, log_file);
  emitter.run_end(run_id, true, "ok", log_file);
  return 0;
}
