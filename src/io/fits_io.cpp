#include "lucky_stack/io/fits_io.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"

#include <fitsio.h>
#include <cstring>

namespace lucky_stack::io {

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

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

struct FitsCloser {
    fitsfile* fptr;
    ~FitsCloser() {
        if (fptr) {
            int status = 0;
            fits_close_file(fptr, &status);
        }
    }
};

bool is_structural_key(const std::string& key) {
    return key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END";
}

// Keyword values keep their FITS type: integers, reals, everything else as text.
FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    if (fits_get_hdrspace(fptr, &nkeys, nullptr, &status)) {
        return header;
    }

    char name[FLEN_KEYWORD];
    char value[FLEN_VALUE];
    char comment[FLEN_COMMENT];
    for (int k = 1; k <= nkeys; ++k) {
        status = 0;
        if (fits_read_keyn(fptr, k, name, value, comment, &status)) continue;
        const std::string key(name);
        if (is_structural_key(key) || value[0] == '\0') continue;

        char type = 'C';
        if (fits_get_keytype(value, &type, &status)) continue;

        if (type == 'I') {
            int iv = 0;
            if (!fits_read_key(fptr, TINT, name, &iv, nullptr, &status)) {
                header.set(key, iv);
                continue;
            }
        } else if (type == 'F') {
            double dv = 0.0;
            if (!fits_read_key(fptr, TDOUBLE, name, &dv, nullptr, &status)) {
                header.set(key, dv);
                continue;
            }
        }

        status = 0;
        char text[FLEN_VALUE];
        if (type == 'C' && !fits_read_key(fptr, TSTRING, name, text, nullptr, &status)) {
            header.set(key, std::string(text));
        } else {
            header.set(key, std::string(value));
        }
    }
    return header;
}

// Keys longer than 8 characters are not representable as plain FITS keywords.
void write_header(fitsfile* fptr, const FitsHeader& header, int* status) {
    auto writable = [](const std::string& key) { return !key.empty() && key.size() <= 8; };

    for (const auto& [key, value] : header.int_values) {
        if (!writable(key)) continue;
        int v = value;
        fits_update_key(fptr, TINT, key.c_str(), &v, nullptr, status);
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (!writable(key)) continue;
        double v = value;
        fits_update_key(fptr, TDOUBLE, key.c_str(), &v, nullptr, status);
    }
    for (const auto& [key, value] : header.string_values) {
        if (!writable(key)) continue;
        std::string v = value;
        fits_update_key(fptr, TSTRING, key.c_str(), v.data(), nullptr, status);
    }
}

} // namespace

std::pair<std::vector<Matrix2Df>, FitsHeader> read_fits_cube(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    FitsCloser closer{fptr};

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    if (fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status)) {
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2 || naxis > 3) {
        throw FitsError("Expected a 2-D image or 3-D cube, got NAXIS=" +
                        std::to_string(naxis) + ": " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long planes = (naxis == 3) ? naxes[2] : 1;
    const long npixels = width * height;

    std::vector<Matrix2Df> frames;
    frames.reserve(static_cast<size_t>(planes));
    std::vector<float> buffer(static_cast<size_t>(npixels));
    for (long k = 0; k < planes; ++k) {
        long fpixel[3] = {1, 1, k + 1};
        if (fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, buffer.data(), nullptr,
                          &status)) {
            throw FitsError("Cannot read FITS pixel data (plane " + std::to_string(k) +
                            "): " + path.string());
        }
        Matrix2Df data(height, width);
        std::memcpy(data.data(), buffer.data(), buffer.size() * sizeof(float));
        frames.push_back(std::move(data));
    }

    FitsHeader header = read_header(fptr);
    return {std::move(frames), std::move(header)};
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    auto [frames, header] = read_fits_cube(path);
    if (frames.empty()) {
        throw FitsError("No image plane in " + path.string());
    }
    return {std::move(frames.front()), std::move(header)};
}

void write_fits_cube(const fs::path& path, const std::vector<Matrix2Df>& frames,
                     const FitsHeader& header) {
    if (frames.empty()) {
        throw FitsError("Refusing to write an empty cube: " + path.string());
    }
    const Matrix2Df& first = frames.front();
    for (size_t k = 1; k < frames.size(); ++k) {
        if (!core::same_shape(frames[k], first)) {
            throw DimensionError("cube plane " + std::to_string(k) + " is " +
                                 core::shape_string(frames[k]) + ", plane 0 is " +
                                 core::shape_string(first));
        }
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }
    FitsCloser closer{fptr};

    const int naxis = frames.size() > 1 ? 3 : 2;
    long naxes[3] = {static_cast<long>(first.cols()), static_cast<long>(first.rows()),
                     static_cast<long>(frames.size())};
    if (fits_create_img(fptr, FLOAT_IMG, naxis, naxes, &status)) {
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header(fptr, header, &status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    const long npixels = static_cast<long>(first.size());
    for (size_t k = 0; k < frames.size(); ++k) {
        long fpixel[3] = {1, 1, static_cast<long>(k) + 1};
        if (fits_write_pix(fptr, TFLOAT, fpixel, npixels,
                           const_cast<float*>(frames[k].data()), &status)) {
            throw FitsError("Cannot write FITS pixel data (plane " + std::to_string(k) +
                            "): " + path.string());
        }
    }
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    write_fits_cube(path, std::vector<Matrix2Df>{data}, header);
}

} // namespace lucky_stack::io
