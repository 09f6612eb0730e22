#include "stack_clip/clip/stack_clipper.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/core/utils.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

namespace stack_clip::clip {

void validate_stack(const StackView& stack, const ClipParams& params) {
    validate_clip_params(params);

    if (stack.num_images < 0) {
        throw ValidationError("num_images must be >= 0");
    }
    if (stack.num_images > params.capacity) {
        throw CapacityError(stack.num_images, params.capacity);
    }
    if (stack.sample_count() == 0) {
        return;
    }
    if (stack.data == nullptr) {
        throw ValidationError("data array is required");
    }
    if (stack.mask == nullptr) {
        throw ValidationError("mask array is required");
    }
    if (stack.has_variance && stack.variance == nullptr) {
        throw ValidationError("has_variance is set but no variance array was given");
    }
}

ClipSummary clip_stack(const StackView& stack, const ClipParams& params,
                       const ClipRunOptions& options) {
    validate_stack(stack, params);

    ClipSummary summary;
    const bool has_variance = stack.has_variance && stack.variance != nullptr;
    summary.bounds = resolve_bounds_strategy(
        has_variance, params.bounds == BoundsStrategy::SIGMA_CLIP);

    const size_t total = stack.pixel_count;
    if (total == 0) {
        return summary;
    }

    const auto strategy = make_rejection_strategy(summary.bounds);
    const size_t batch = std::max<size_t>(1, options.batch_pixels);
    const size_t n_batches = (total + batch - 1) / batch;
    const int n_workers = core::compute_worker_count(options.workers, n_batches);
    summary.workers = n_workers;

    std::atomic<size_t> next_batch{0};
    std::atomic<size_t> pixels_done{0};
    std::atomic<bool> failed{false};
    std::atomic<bool> stopped{false};
    std::mutex merge_mutex;
    std::mutex progress_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        ClipSummary local;
        try {
            SampleBuffer buffer(params.capacity);
            buffer.reserve(stack.num_images);

            while (!failed.load(std::memory_order_relaxed)) {
                if (options.stop_flag &&
                    options.stop_flag->load(std::memory_order_relaxed)) {
                    stopped.store(true, std::memory_order_relaxed);
                    break;
                }
                const size_t b = next_batch.fetch_add(1);
                if (b >= n_batches) {
                    break;
                }
                const size_t begin = b * batch;
                const size_t end = std::min(total, begin + batch);

                for (size_t i = begin; i < end; ++i) {
                    buffer.load(stack, i);
                    const ColumnResult r = clip_column(buffer, params, *strategy);
                    buffer.store_mask(stack, i);

                    if (r.termination == Termination::CONVERGED) {
                        ++local.converged;
                    } else {
                        ++local.hit_max_iters;
                    }
                    local.rejected +=
                        static_cast<uint64_t>(r.ngood_initial - r.ngood);
                    local.max_passes = std::max(local.max_passes, r.passes);
                }

                // counted under the lock so callbacks see done increase
                std::lock_guard<std::mutex> lock(progress_mutex);
                const size_t done = pixels_done.fetch_add(end - begin) + (end - begin);
                if (options.progress) {
                    options.progress(done, total);
                }
            }
        } catch (...) {
            failed.store(true, std::memory_order_relaxed);
            std::lock_guard<std::mutex> lock(merge_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
        }

        std::lock_guard<std::mutex> lock(merge_mutex);
        summary.converged += local.converged;
        summary.hit_max_iters += local.hit_max_iters;
        summary.rejected += local.rejected;
        summary.max_passes = std::max(summary.max_passes, local.max_passes);
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    if (stopped.load(std::memory_order_relaxed)) {
        throw StopRequested();
    }

    summary.pixels = pixels_done.load();
    return summary;
}

ClipSummary iterclip(const float* data, uint16_t* mask, const float* variance,
                     bool has_variance, int num_images, size_t pixel_count,
                     double lsigma, double hsigma, int max_iters, bool mclip,
                     bool sigclip) {
    StackView stack;
    stack.data = data;
    stack.mask = mask;
    stack.variance = has_variance ? variance : nullptr;
    stack.has_variance = has_variance;
    stack.num_images = num_images;
    stack.pixel_count = pixel_count;

    const ClipParams params =
        make_clip_params(lsigma, hsigma, max_iters, mclip, sigclip);
    return clip_stack(stack, params);
}

ClipSummary iterclip(const std::vector<float>& data, std::vector<uint16_t>& mask,
                     const std::vector<float>& variance, bool has_variance,
                     int num_images, size_t pixel_count, double lsigma,
                     double hsigma, int max_iters, bool mclip, bool sigclip) {
    if (num_images < 0) {
        throw ValidationError("num_images must be >= 0");
    }
    const size_t expected = static_cast<size_t>(num_images) * pixel_count;
    if (data.size() != expected) {
        throw ValidationError("data holds " + std::to_string(data.size()) +
                              " samples, expected " + std::to_string(expected));
    }
    if (mask.size() != expected) {
        throw ValidationError("mask holds " + std::to_string(mask.size()) +
                              " samples, expected " + std::to_string(expected));
    }
    if (has_variance && variance.size() != expected) {
        throw ValidationError("variance holds " + std::to_string(variance.size()) +
                              " samples, expected " + std::to_string(expected));
    }
    return iterclip(data.data(), mask.data(),
                    has_variance ? variance.data() : nullptr, has_variance,
                    num_images, pixel_count, lsigma, hsigma, max_iters, mclip,
                    sigclip);
}

} // namespace stack_clip::clip
