#pragma once

#include "stack_clip/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace stack_clip::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// One input exposure: science image plus optional variance and mask planes
struct FitsFrame {
    Matrix2Df sci;
    FitsHeader header;
    std::optional<Matrix2Df> variance;
    std::optional<Matrix2Du16> mask;
};

// Shape and plane presence of one input, from headers only
struct FrameLayout {
    int rows = 0;
    int cols = 0;
    bool has_variance = false;
    bool has_mask = false;
    FitsHeader header;
};

bool is_fits_image_path(const fs::path& path);

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// SCI comes from the primary HDU when it holds an image, else from the "SCI"
// extension, else from the first image extension. Extensions named
// variance_extname / mask_extname are read when present and non-empty names
// are given.
FitsFrame read_frame(const fs::path& path, const std::string& variance_extname,
                     const std::string& mask_extname);

// Same HDU selection as read_frame without reading pixels
FrameLayout inspect_frame(const fs::path& path, const std::string& variance_extname,
                          const std::string& mask_extname);

// Single uint16 image in the primary HDU
void write_fits_mask(const fs::path& path, const Matrix2Du16& mask, const FitsHeader& header);

// Primary SCI image followed by VAR and DQ image extensions
void write_fits_product(const fs::path& path, const Matrix2Df& sci,
                        const Matrix2Df& variance, const Matrix2Du16& mask,
                        const FitsHeader& header);

// (width, height, naxis) of the primary image
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

} // namespace stack_clip::io
