#include "stack_clip/io/fits_io.hpp"
#include "stack_clip/core/errors.hpp"
#include "stack_clip/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace stack_clip::io {

namespace {

// Closes the handle on scope exit; errors on close are not reportable there.
class FitsHandle {
public:
    FitsHandle() = default;
    ~FitsHandle() {
        if (fptr_) {
            int status = 0;
            fits_close_file(fptr_, &status);
        }
    }
    FitsHandle(const FitsHandle&) = delete;
    FitsHandle& operator=(const FitsHandle&) = delete;

    fitsfile** out() { return &fptr_; }
    fitsfile* get() const { return fptr_; }

    // Explicit close so that write errors surface
    int close() {
        int status = 0;
        if (fptr_) {
            fits_close_file(fptr_, &status);
            fptr_ = nullptr;
        }
        return status;
    }

private:
    fitsfile* fptr_ = nullptr;
};

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

const std::set<std::string>& reserved_keys() {
    static const std::set<std::string> keys = {
        "SIMPLE", "BITPIX", "NAXIS", "NAXIS1", "NAXIS2", "NAXIS3", "EXTEND",
        "BZERO", "BSCALE", "XTENSION", "PCOUNT", "GCOUNT", "EXTNAME", "END"};
    return keys;
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype = 0;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::logic_error&) {
                    // too wide for int; keep the literal text
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

void write_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    const auto& reserved = reserved_keys();
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !reserved.count(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !reserved.count(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !reserved.count(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !reserved.count(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

// Image in the current HDU; naxis < 2 yields an empty shape
bool current_image_shape(fitsfile* fptr, long& width, long& height) {
    int status = 0;
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status || naxis < 2) {
        return false;
    }
    width = naxes[0];
    height = naxes[1];
    return true;
}

template <typename MatrixT>
MatrixT read_current_image(fitsfile* fptr, int datatype, const fs::path& path,
                           const std::string& what) {
    long width = 0;
    long height = 0;
    if (!current_image_shape(fptr, width, height)) {
        throw FitsError("No 2-D image in " + what + " of " + path.string());
    }

    MatrixT data(height, width);
    long fpixel[3] = {1, 1, 1};
    int status = 0;
    fits_read_pix(fptr, datatype, fpixel, static_cast<LONGLONG>(data.size()), nullptr,
                  data.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read " + what + " pixel data from " + path.string() +
                        ": " + fits_status_text(status));
    }
    return data;
}

bool move_to_extname(fitsfile* fptr, const std::string& extname) {
    if (extname.empty()) return false;
    int status = 0;
    fits_movnam_hdu(fptr, IMAGE_HDU, const_cast<char*>(extname.c_str()), 0, &status);
    return status == 0;
}

bool move_to_first_image(fitsfile* fptr) {
    int status = 0;
    int nhdus = 0;
    fits_get_num_hdus(fptr, &nhdus, &status);
    if (status) return false;
    for (int hdu = 1; hdu <= nhdus; ++hdu) {
        int hdu_type = 0;
        status = 0;
        fits_movabs_hdu(fptr, hdu, &hdu_type, &status);
        if (status || hdu_type != IMAGE_HDU) continue;
        long w = 0;
        long h = 0;
        if (current_image_shape(fptr, w, h)) return true;
    }
    return false;
}

void create_image_hdu(fitsfile* fptr, int bitpix, Eigen::Index rows, Eigen::Index cols,
                      const char* extname, const fs::path& path) {
    int status = 0;
    long naxes[2] = {static_cast<long>(cols), static_cast<long>(rows)};
    fits_create_img(fptr, bitpix, 2, naxes, &status);
    if (!status && extname) {
        fits_update_key(fptr, TSTRING, "EXTNAME", const_cast<char*>(extname), nullptr, &status);
    }
    if (status) {
        throw FitsError("Cannot create FITS image in " + path.string() + ": " +
                        fits_status_text(status));
    }
}

template <typename MatrixT>
void write_current_image(fitsfile* fptr, int datatype, const MatrixT& data,
                         const fs::path& path) {
    int status = 0;
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, datatype, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<typename MatrixT::Scalar*>(data.data()), &status);
    if (status) {
        throw FitsError("Cannot write FITS pixel data: " + path.string() + ": " +
                        fits_status_text(status));
    }
}

void create_file(FitsHandle& handle, const fs::path& path) {
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(handle.out(), filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }
}

void finish_file(FitsHandle& handle, const fs::path& path) {
    const int status = handle.close();
    if (status) {
        throw FitsError("Cannot finalize FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    FitsHandle handle;
    int status = 0;

    if (fits_open_file(handle.out(), path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    FitsHeader header = read_header(handle.get());
    Matrix2Df data = read_current_image<Matrix2Df>(handle.get(), TFLOAT, path, "primary HDU");
    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    FitsHandle handle;
    create_file(handle, path);
    create_image_hdu(handle.get(), FLOAT_IMG, data.rows(), data.cols(), nullptr, path);

    int status = 0;
    write_header(handle.get(), header, status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }
    write_current_image(handle.get(), TFLOAT, data, path);
    finish_file(handle, path);
}

namespace {

// Opens path and positions on the SCI image; returns the primary header
FitsHeader open_sci(FitsHandle& handle, const fs::path& path) {
    int status = 0;
    if (fits_open_file(handle.out(), path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    fitsfile* fptr = handle.get();
    FitsHeader header = read_header(fptr);

    long w = 0;
    long h = 0;
    if (!current_image_shape(fptr, w, h) && !move_to_extname(fptr, "SCI") &&
        !move_to_first_image(fptr)) {
        throw FitsError("No image HDU in " + path.string());
    }
    return header;
}

// Moves to extname and checks its shape; false when the extension is absent
bool move_to_plane(fitsfile* fptr, const std::string& extname, long width, long height,
                   const fs::path& path) {
    if (!move_to_extname(fptr, extname)) return false;
    long w = 0;
    long h = 0;
    if (!current_image_shape(fptr, w, h) || w != width || h != height) {
        throw FitsError(extname + " shape differs from SCI in " + path.string());
    }
    return true;
}

} // namespace

FrameLayout inspect_frame(const fs::path& path, const std::string& variance_extname,
                          const std::string& mask_extname) {
    FitsHandle handle;
    FrameLayout layout;
    layout.header = open_sci(handle, path);

    long w = 0;
    long h = 0;
    current_image_shape(handle.get(), w, h);
    layout.rows = static_cast<int>(h);
    layout.cols = static_cast<int>(w);
    layout.has_variance = move_to_plane(handle.get(), variance_extname, w, h, path);
    layout.has_mask = move_to_plane(handle.get(), mask_extname, w, h, path);
    return layout;
}

FitsFrame read_frame(const fs::path& path, const std::string& variance_extname,
                     const std::string& mask_extname) {
    FitsHandle handle;
    FitsFrame frame;
    frame.header = open_sci(handle, path);
    fitsfile* fptr = handle.get();
    frame.sci = read_current_image<Matrix2Df>(fptr, TFLOAT, path, "SCI");

    const long w = static_cast<long>(frame.sci.cols());
    const long h = static_cast<long>(frame.sci.rows());
    if (move_to_plane(fptr, variance_extname, w, h, path)) {
        frame.variance = read_current_image<Matrix2Df>(fptr, TFLOAT, path, variance_extname);
    }
    if (move_to_plane(fptr, mask_extname, w, h, path)) {
        frame.mask = read_current_image<Matrix2Du16>(fptr, TUSHORT, path, mask_extname);
    }
    return frame;
}

void write_fits_mask(const fs::path& path, const Matrix2Du16& mask, const FitsHeader& header) {
    FitsHandle handle;
    create_file(handle, path);
    create_image_hdu(handle.get(), USHORT_IMG, mask.rows(), mask.cols(), nullptr, path);

    int status = 0;
    write_header(handle.get(), header, status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }
    write_current_image(handle.get(), TUSHORT, mask, path);
    finish_file(handle, path);
}

void write_fits_product(const fs::path& path, const Matrix2Df& sci,
                        const Matrix2Df& variance, const Matrix2Du16& mask,
                        const FitsHeader& header) {
    if (variance.rows() != sci.rows() || variance.cols() != sci.cols() ||
        mask.rows() != sci.rows() || mask.cols() != sci.cols()) {
        throw ValidationError("SCI, VAR and DQ planes must share one shape");
    }

    FitsHandle handle;
    create_file(handle, path);
    fitsfile* fptr = handle.get();

    create_image_hdu(fptr, FLOAT_IMG, sci.rows(), sci.cols(), nullptr, path);
    int status = 0;
    write_header(fptr, header, status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }
    write_current_image(fptr, TFLOAT, sci, path);

    create_image_hdu(fptr, FLOAT_IMG, variance.rows(), variance.cols(), "VAR", path);
    write_current_image(fptr, TFLOAT, variance, path);

    create_image_hdu(fptr, USHORT_IMG, mask.rows(), mask.cols(), "DQ", path);
    write_current_image(fptr, TUSHORT, mask, path);

    finish_file(handle, path);
}

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    FitsHandle handle;
    int status = 0;

    if (fits_open_file(handle.out(), path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(handle.get(), 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS dimensions: " + path.string());
    }

    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), naxis};
}

} // namespace stack_clip::io
