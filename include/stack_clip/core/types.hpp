#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stack_clip {

namespace fs = std::filesystem;

// Matrix types (frames are row-major like FITS NAXIS1-fastest storage)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du16 = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

// Central estimate used by the convergence loop
enum class CenterStrategy {
    MEDIAN_THEN_MEAN,  // median on the first pass, mean afterwards
    MEDIAN             // median on every pass
};

inline std::string center_strategy_to_string(CenterStrategy s) {
    switch (s) {
        case CenterStrategy::MEDIAN_THEN_MEAN: return "median_then_mean";
        case CenterStrategy::MEDIAN: return "median";
        default: return "unknown";
    }
}

// Source of the rejection scale
enum class BoundsStrategy {
    SIGMA_CLIP,    // column scatter, shared bounds
    VARIANCE_CLIP  // per-sample external variance
};

inline std::string bounds_strategy_to_string(BoundsStrategy s) {
    switch (s) {
        case BoundsStrategy::SIGMA_CLIP: return "sigma_clip";
        case BoundsStrategy::VARIANCE_CLIP: return "variance_clip";
        default: return "unknown";
    }
}

enum class Termination {
    CONVERGED,
    MAX_ITERS
};

inline std::string termination_to_string(Termination t) {
    switch (t) {
        case Termination::CONVERGED: return "converged";
        case Termination::MAX_ITERS: return "max_iters";
        default: return "unknown";
    }
}

enum class CombineMethod {
    MEAN,
    MEDIAN
};

inline std::string combine_method_to_string(CombineMethod m) {
    switch (m) {
        case CombineMethod::MEAN: return "mean";
        case CombineMethod::MEDIAN: return "median";
        default: return "unknown";
    }
}

inline bool string_to_combine_method(const std::string& s, CombineMethod& out) {
    const std::string norm = normalize_token(s);
    if (norm == "mean" || norm == "average") {
        out = CombineMethod::MEAN;
        return true;
    }
    if (norm == "median") {
        out = CombineMethod::MEDIAN;
        return true;
    }
    return false;
}

// Runner phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    LOAD_STACK = 1,
    CLIP = 2,
    COMBINE = 3,
    WRITE_OUTPUT = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::LOAD_STACK: return "LOAD_STACK";
        case Phase::CLIP: return "CLIP";
        case Phase::COMBINE: return "COMBINE";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace stack_clip
