#include "stack_clip/clip/robust_stats.hpp"

#include <algorithm>
#include <cmath>

namespace stack_clip::clip {

namespace {

struct Moments {
    double sum = 0.0;
    double sumsq = 0.0;
    int count = 0;
    bool fallback = false;
};

void add_samples(Moments& m, const float* values, const uint16_t* mask, int n) {
    for (int i = 0; i < n; ++i) {
        if (!sample_used(values[i], mask[i], m.fallback)) continue;
        const double v = static_cast<double>(values[i]);
        m.sum += v;
        m.sumsq += v * v;
        ++m.count;
    }
}

Moments accumulate(const float* values, const uint16_t* mask, int n) {
    Moments m;
    add_samples(m, values, mask, n);
    if (m.count > 0 || n == 0) {
        return m;
    }

    // Nothing usable unmasked: fall back to every finite sample
    m.fallback = true;
    add_samples(m, values, mask, n);
    return m;
}

double population_variance(const Moments& m) {
    if (m.count <= 0) return 0.0;
    const double mean = m.sum / static_cast<double>(m.count);
    const double var = m.sumsq / static_cast<double>(m.count) - mean * mean;
    // cancellation can leave a tiny negative
    return var < 0.0 ? 0.0 : var;
}

} // namespace

ColumnStats masked_mean(const float* values, const uint16_t* mask, int n) {
    const Moments m = accumulate(values, mask, n);
    ColumnStats out;
    out.count = m.count;
    out.fallback = m.fallback;
    if (m.count > 0) {
        out.center = m.sum / static_cast<double>(m.count);
        out.variance = population_variance(m);
    }
    return out;
}

ColumnStats masked_median(const float* values, const uint16_t* mask, int n,
                          std::vector<float>& scratch) {
    const Moments m = accumulate(values, mask, n);
    ColumnStats out;
    out.count = m.count;
    out.fallback = m.fallback;
    if (m.count <= 0) {
        return out;
    }
    out.variance = population_variance(m);

    scratch.clear();
    for (int i = 0; i < n; ++i) {
        if (sample_used(values[i], mask[i], m.fallback)) {
            scratch.push_back(values[i]);
        }
    }

    const size_t count = scratch.size();
    const size_t mid = count / 2;
    std::nth_element(scratch.begin(), scratch.begin() + static_cast<std::ptrdiff_t>(mid),
                     scratch.end());
    const double hi = static_cast<double>(scratch[mid]);
    if ((count % 2) == 1) {
        out.center = hi;
        return out;
    }
    std::nth_element(scratch.begin(), scratch.begin() + static_cast<std::ptrdiff_t>(mid - 1),
                     scratch.end());
    const double lo = static_cast<double>(scratch[mid - 1]);
    out.center = 0.5 * (lo + hi);
    return out;
}

ColumnStats masked_mean(const SampleBuffer& buffer) {
    return masked_mean(buffer.values(), buffer.mask(), buffer.size());
}

ColumnStats masked_median(SampleBuffer& buffer) {
    return masked_median(buffer.values(), buffer.mask(), buffer.size(), buffer.scratch());
}

} // namespace stack_clip::clip
