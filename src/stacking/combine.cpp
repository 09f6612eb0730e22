#include "stack_clip/stacking/combine.hpp"
#include "stack_clip/clip/robust_stats.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>

namespace stack_clip::stacking {

namespace {
constexpr double kMedianVarianceFactor = 1.5707963267948966;  // pi / 2
} // namespace

CombinedPixel combine_column(clip::SampleBuffer& buffer, CombineMethod method) {
    CombinedPixel out;
    const clip::ColumnStats stats = method == CombineMethod::MEDIAN
                                        ? clip::masked_median(buffer)
                                        : clip::masked_mean(buffer);
    const uint16_t* mask = buffer.mask();
    out.n_used = stats.count;
    out.fallback = stats.fallback;
    if (stats.fallback) {
        for (int i = 0; i < buffer.size(); ++i) {
            out.mask |= mask[i];
        }
    }
    if (stats.count <= 0) {
        // no finite sample at all: blank output pixel
        if (buffer.size() > 0) out.value = std::numeric_limits<float>::quiet_NaN();
        return out;
    }
    out.value = static_cast<float>(stats.center);

    const float* variance = buffer.variance();
    const double n = static_cast<double>(stats.count);

    if (variance != nullptr) {
        double var_sum = 0.0;
        for (int i = 0; i < buffer.size(); ++i) {
            if (clip::sample_used(buffer.values()[i], mask[i], stats.fallback)) {
                var_sum += static_cast<double>(variance[i]);
            }
        }
        double var = var_sum / (n * n);
        if (method == CombineMethod::MEDIAN) {
            var *= kMedianVarianceFactor;
        }
        out.variance = static_cast<float>(var);
    } else {
        out.variance = static_cast<float>(stats.variance / n);
    }
    return out;
}

CombineResult combine_stack(const clip::StackView& stack, const CombineOptions& options) {
    if (stack.num_images > options.capacity) {
        throw CapacityError(stack.num_images, options.capacity);
    }
    if (stack.sample_count() > 0 && (stack.data == nullptr || stack.mask == nullptr)) {
        throw ValidationError("combine requires data and mask arrays");
    }

    const size_t total = stack.pixel_count;
    CombineResult result;
    result.data.assign(total, 0.0f);
    result.variance.assign(total, 0.0f);
    result.mask.assign(total, 0);
    result.n_used.assign(total, 0);
    if (total == 0) {
        return result;
    }

    const size_t batch = std::max<size_t>(1, options.batch_pixels);
    const size_t n_batches = (total + batch - 1) / batch;
    const int n_workers = core::compute_worker_count(options.workers, n_batches);

    std::atomic<size_t> next_batch{0};
    std::atomic<size_t> fallback_pixels{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        try {
            clip::SampleBuffer buffer(options.capacity);
            buffer.reserve(stack.num_images);
            size_t local_fallback = 0;
            while (!failed.load(std::memory_order_relaxed)) {
                const size_t b = next_batch.fetch_add(1);
                if (b >= n_batches) {
                    break;
                }
                const size_t begin = b * batch;
                const size_t end = std::min(total, begin + batch);
                for (size_t i = begin; i < end; ++i) {
                    buffer.load(stack, i);
                    const CombinedPixel px = combine_column(buffer, options.method);
                    result.data[i] = px.value;
                    result.variance[i] = px.variance;
                    result.mask[i] = px.mask;
                    result.n_used[i] = px.n_used;
                    if (px.fallback) ++local_fallback;
                }
            }
            fallback_pixels.fetch_add(local_fallback);
        } catch (...) {
            failed.store(true, std::memory_order_relaxed);
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
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
    result.fallback_pixels = fallback_pixels.load();
    return result;
}

CombineResult combine_stack(const clip::StackView& stack, CombineMethod method) {
    CombineOptions options;
    options.method = method;
    return combine_stack(stack, options);
}

} // namespace stack_clip::stacking
