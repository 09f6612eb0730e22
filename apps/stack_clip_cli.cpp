#include "stack_clip/clip/column_clip.hpp"
#include "stack_clip/config/configuration.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/core/types.hpp"
#include "stack_clip/core/utils.hpp"
#include "stack_clip/io/fits_io.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// "1,2,inf" -> {1, 2, inf}; empty text gives an empty list
static std::vector<float> parse_float_list(const std::string& text, const char* what) {
    std::vector<float> out;
    if (text.empty()) return out;
    for (const auto& tok : stack_clip::core::split(text, ',')) {
        if (tok.empty()) continue;
        size_t used = 0;
        try {
            out.push_back(std::stof(tok, &used));
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != tok.size()) {
            throw stack_clip::ValidationError(std::string(what) + ": not a number: '" + tok + "'");
        }
    }
    return out;
}

// "0,1,4" -> mask words, each in [0, 65535]
static std::vector<uint16_t> parse_mask_list(const std::string& text, const char* what) {
    std::vector<uint16_t> out;
    if (text.empty()) return out;
    for (const auto& tok : stack_clip::core::split(text, ',')) {
        if (tok.empty()) continue;
        out.push_back(static_cast<uint16_t>(
            stack_clip::core::parse_integer(tok, 0, std::numeric_limits<uint16_t>::max(), what)));
    }
    return out;
}

static double parse_number(const std::string& text, double fallback, const char* what) {
    if (text.empty()) return fallback;
    try {
        return std::stod(text);
    } catch (const std::logic_error&) {
        throw stack_clip::ValidationError(std::string(what) + ": not a number: '" + text + "'");
    }
}

static json compute_stats_buffer(const float* data, size_t count) {
    double mean = 0.0;
    double m2 = 0.0;
    int64_t n = 0;

    float min_v = std::numeric_limits<float>::infinity();
    float max_v = -std::numeric_limits<float>::infinity();
    int64_t n_nan = 0;
    int64_t n_inf = 0;

    for (size_t i = 0; i < count; ++i) {
        const float v = data[i];
        if (std::isnan(v)) {
            n_nan++;
            continue;
        }
        if (!std::isfinite(v)) {
            n_inf++;
            continue;
        }
        if (v < min_v) min_v = v;
        if (v > max_v) max_v = v;

        n++;
        const double x = static_cast<double>(v);
        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        m2 += delta * (x - mean);
    }

    json j;
    j["count"] = n;
    j["nan"] = n_nan;
    j["inf"] = n_inf;
    j["min"] = (n > 0) ? min_v : 0.0f;
    j["max"] = (n > 0) ? max_v : 0.0f;
    j["mean"] = (n > 0) ? mean : 0.0;
    j["stddev"] = (n > 1) ? std::sqrt(m2 / static_cast<double>(n - 1)) : 0.0;
    return j;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << stack_clip::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// load-config <path>
// ============================================================================
int cmd_load_config(const std::string& path) {
    fs::path p(path);
    json result;
    result["path"] = path;
    if (!fs::exists(p)) {
        result["ok"] = false;
        result["error"] = "File not found: " + path;
        print_json(result);
        return 1;
    }

    result["yaml"] = stack_clip::core::read_text(p);
    try {
        auto cfg = stack_clip::config::Config::load(p);
        YAML::Emitter out;
        out << cfg.to_yaml();
        result["ok"] = true;
        result["effective_yaml"] = std::string(out.c_str());
    } catch (const std::exception& e) {
        result["ok"] = false;
        result["error"] = e.what();
        print_json(result);
        return 1;
    }
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = stack_clip::core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        YAML::Node node = YAML::Load(yaml_text);
        auto cfg = stack_clip::config::Config::from_yaml(node);
        cfg.validate();
        if (std::isinf(cfg.clip.lsigma) && std::isinf(cfg.clip.hsigma)) {
            result["warnings"].push_back("clip.lsigma and clip.hsigma are both infinite; no sample can be rejected");
        }
        if (cfg.clip.sigclip && cfg.input.use_variance) {
            result["warnings"].push_back("clip.sigclip is set; input variance only feeds the combined variance");
        }
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// clip-column --values v1,v2,... [--mask m1,...] [--variance s1,...]
//             [--lsigma X] [--hsigma Y] [--max-iters N] [--no-mclip] [--sigclip]
// ============================================================================
int cmd_clip_column(const std::string& values_arg, const std::string& mask_arg,
                    const std::string& variance_arg, const std::string& lsigma_arg,
                    const std::string& hsigma_arg, const std::string& max_iters_arg,
                    bool mclip, bool sigclip) {
    namespace clip = stack_clip::clip;

    json result;
    try {
        const auto values = parse_float_list(values_arg, "--values");
        auto mask = parse_mask_list(mask_arg, "--mask");
        const auto variance = parse_float_list(variance_arg, "--variance");
        if (mask.empty()) mask.assign(values.size(), 0);
        if (mask.size() != values.size()) {
            throw stack_clip::ValidationError("--mask needs one entry per value");
        }
        if (!variance.empty() && variance.size() != values.size()) {
            throw stack_clip::ValidationError("--variance needs one entry per value");
        }

        const double lsigma = parse_number(lsigma_arg, 3.0, "--lsigma");
        const double hsigma = parse_number(hsigma_arg, 3.0, "--hsigma");
        const int max_iters = max_iters_arg.empty()
            ? 0
            : static_cast<int>(stack_clip::core::parse_integer(
                  max_iters_arg, 0, std::numeric_limits<int>::max(), "--max-iters"));
        clip::ClipParams params = clip::make_clip_params(lsigma, hsigma, max_iters, mclip, sigclip);
        clip::validate_clip_params(params);

        clip::SampleBuffer buffer(params.capacity);
        buffer.assign(values, mask, variance);
        const auto strategy = clip::make_rejection_strategy(
            clip::resolve_bounds_strategy(buffer.has_variance(), sigclip));
        const clip::ColumnResult res = clip::clip_column(buffer, params, *strategy);

        result["ok"] = true;
        result["mask"] = std::vector<uint16_t>(buffer.mask(), buffer.mask() + buffer.size());
        result["ngood_initial"] = res.ngood_initial;
        result["ngood"] = res.ngood;
        result["passes"] = res.passes;
        result["termination"] = stack_clip::termination_to_string(res.termination);
        result["center"] = res.stats.center;
        result["stddev"] = std::sqrt(res.stats.variance);
        result["fallback"] = res.stats.fallback;
        result["bounds"] = stack_clip::bounds_strategy_to_string(strategy->kind());
    } catch (const std::exception& e) {
        result["ok"] = false;
        result["error"] = e.what();
        print_json(result);
        return 2;
    }
    print_json(result);
    return 0;
}

// ============================================================================
// fits-stats <path>
// ============================================================================
int cmd_fits_stats(const std::string& path) {
    json result;
    result["path"] = path;
    try {
        auto [img, header] = stack_clip::io::read_fits_float(fs::path(path));
        result["ok"] = true;
        result["naxes"] = json::array({static_cast<int64_t>(img.cols()), static_cast<int64_t>(img.rows())});
        result["pixels"] = static_cast<int64_t>(img.size());
        result["stats"] = compute_stats_buffer(img.data(), static_cast<size_t>(img.size()));
        if (auto ncomb = header.get_int("NCOMBINE")) result["ncombine"] = *ncomb;
    } catch (const std::exception& e) {
        result["ok"] = false;
        result["error"] = e.what();
        print_json(result);
        return 1;
    }
    print_json(result);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: stack_clip_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  load-config <path>              Load and normalize a config YAML file\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]  Validate config\n"
              << "  clip-column --values V [--mask M] [--variance S] [--lsigma X] [--hsigma Y]\n"
              << "              [--max-iters N] [--no-mclip] [--sigclip]  Clip one pixel column\n"
              << "  fits-stats <path>               Print basic statistics for a FITS image\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "load-config") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "load-config requires a path argument\n";
            return 1;
        }
        return cmd_load_config(path);
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "clip-column") {
        std::string values = get_arg("--values");
        if (values.empty()) {
            std::cerr << "clip-column requires --values v1,v2,...\n";
            return 1;
        }
        return cmd_clip_column(values, get_arg("--mask"), get_arg("--variance"),
                               get_arg("--lsigma"), get_arg("--hsigma"),
                               get_arg("--max-iters"), !has_flag("--no-mclip"),
                               has_flag("--sigclip"));
    }

    if (command == "fits-stats") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "fits-stats requires a path argument\n";
            return 1;
        }
        return cmd_fits_stats(path);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
