#include "stack_clip/config/configuration.hpp"
#include "stack_clip/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <limits>

namespace stack_clip::config {

static void check_sigma(double v, const char* name) {
    if (std::isnan(v) || v < 0.0) {
        throw ValidationError(std::string("clip.") + name + " must be >= 0 (.inf disables the bound)");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["input"]) {
        auto in = node["input"];
        if (in["pattern"]) cfg.input.pattern = in["pattern"].as<std::string>();
        if (in["max_frames"]) cfg.input.max_frames = in["max_frames"].as<int>();
        if (in["use_variance"]) cfg.input.use_variance = in["use_variance"].as<bool>();
        if (in["use_mask"]) cfg.input.use_mask = in["use_mask"].as<bool>();
        if (in["variance_extname"]) cfg.input.variance_extname = in["variance_extname"].as<std::string>();
        if (in["mask_extname"]) cfg.input.mask_extname = in["mask_extname"].as<std::string>();
    }

    if (node["clip"]) {
        auto c = node["clip"];
        if (c["lsigma"]) cfg.clip.lsigma = c["lsigma"].as<double>();
        if (c["hsigma"]) cfg.clip.hsigma = c["hsigma"].as<double>();
        if (c["sigma"]) {
            // shorthand for symmetric bounds
            cfg.clip.lsigma = c["sigma"].as<double>();
            cfg.clip.hsigma = cfg.clip.lsigma;
        }
        if (c["max_iters"]) cfg.clip.max_iters = c["max_iters"].as<int>();
        if (c["mclip"]) cfg.clip.mclip = c["mclip"].as<bool>();
        if (c["sigclip"]) cfg.clip.sigclip = c["sigclip"].as<bool>();
        if (c["reject_bit"]) cfg.clip.reject_bit = c["reject_bit"].as<int>();
        if (c["capacity"]) cfg.clip.capacity = c["capacity"].as<int>();
    }

    if (node["combine"]) {
        auto cb = node["combine"];
        if (cb["method"]) cfg.combine.method = cb["method"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["combined_file"]) cfg.output.combined_file = o["combined_file"].as<std::string>();
        if (o["write_masks"]) cfg.output.write_masks = o["write_masks"].as<bool>();
        if (o["mask_suffix"]) cfg.output.mask_suffix = o["mask_suffix"].as<std::string>();
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        if (r["batch_pixels"]) cfg.runtime.batch_pixels = r["batch_pixels"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["pattern"] = input.pattern;
    node["input"]["max_frames"] = input.max_frames;
    node["input"]["use_variance"] = input.use_variance;
    node["input"]["use_mask"] = input.use_mask;
    node["input"]["variance_extname"] = input.variance_extname;
    node["input"]["mask_extname"] = input.mask_extname;

    node["clip"]["lsigma"] = clip.lsigma;
    node["clip"]["hsigma"] = clip.hsigma;
    node["clip"]["max_iters"] = clip.max_iters;
    node["clip"]["mclip"] = clip.mclip;
    node["clip"]["sigclip"] = clip.sigclip;
    node["clip"]["reject_bit"] = clip.reject_bit;
    node["clip"]["capacity"] = clip.capacity;

    node["combine"]["method"] = combine.method;

    node["output"]["combined_file"] = output.combined_file;
    node["output"]["write_masks"] = output.write_masks;
    node["output"]["mask_suffix"] = output.mask_suffix;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["batch_pixels"] = runtime.batch_pixels;

    return node;
}

void Config::validate() const {
    if (input.pattern.empty()) {
        throw ValidationError("input.pattern must not be empty");
    }
    if (input.max_frames < 0) {
        throw ValidationError("input.max_frames must be >= 0");
    }
    if (input.use_variance && input.variance_extname.empty()) {
        throw ValidationError("input.variance_extname must not be empty when use_variance is set");
    }
    if (input.use_mask && input.mask_extname.empty()) {
        throw ValidationError("input.mask_extname must not be empty when use_mask is set");
    }

    check_sigma(clip.lsigma, "lsigma");
    check_sigma(clip.hsigma, "hsigma");
    if (clip.max_iters < 0) {
        throw ValidationError("clip.max_iters must be >= 0 (0 selects 100)");
    }
    if (clip.reject_bit < 1 || clip.reject_bit > std::numeric_limits<uint16_t>::max()) {
        throw ValidationError("clip.reject_bit must be in [1, 65535]");
    }
    if (clip.capacity < 1) {
        throw ValidationError("clip.capacity must be >= 1");
    }

    CombineMethod method;
    if (!string_to_combine_method(combine.method, method)) {
        throw ValidationError("combine.method must be 'mean' or 'median'");
    }

    if (output.combined_file.empty()) {
        throw ValidationError("output.combined_file must not be empty");
    }
    if (output.write_masks && output.mask_suffix.empty()) {
        throw ValidationError("output.mask_suffix must not be empty when write_masks is set");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }
    if (runtime.batch_pixels < 1) {
        throw ValidationError("runtime.batch_pixels must be >= 1");
    }
}

clip::ClipParams Config::clip_params() const {
    clip::ClipParams p = clip::make_clip_params(clip.lsigma, clip.hsigma,
                                                clip.max_iters, clip.mclip,
                                                clip.sigclip);
    p.reject_bit = static_cast<uint16_t>(clip.reject_bit);
    p.capacity = clip.capacity;
    return p;
}

CombineMethod Config::combine_method() const {
    CombineMethod method = CombineMethod::MEAN;
    if (!string_to_combine_method(combine.method, method)) {
        throw ValidationError("combine.method must be 'mean' or 'median'");
    }
    return method;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "input": {
      "type": "object",
      "properties": {
        "pattern": {"type": "string"},
        "max_frames": {"type": "integer", "minimum": 0},
        "use_variance": {"type": "boolean"},
        "use_mask": {"type": "boolean"},
        "variance_extname": {"type": "string"},
        "mask_extname": {"type": "string"}
      }
    },
    "clip": {
      "type": "object",
      "properties": {
        "lsigma": {"type": "number", "minimum": 0},
        "hsigma": {"type": "number", "minimum": 0},
        "sigma": {"type": "number", "minimum": 0},
        "max_iters": {"type": "integer", "minimum": 0},
        "mclip": {"type": "boolean"},
        "sigclip": {"type": "boolean"},
        "reject_bit": {"type": "integer", "minimum": 1, "maximum": 65535},
        "capacity": {"type": "integer", "minimum": 1}
      }
    },
    "combine": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["mean", "median"]}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "combined_file": {"type": "string", "minLength": 1},
        "write_masks": {"type": "boolean"},
        "mask_suffix": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1},
        "batch_pixels": {"type": "integer", "minimum": 1}
      }
    }
  }
})";
}

} // namespace stack_clip::config
