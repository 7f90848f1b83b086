#include "provmark/perceptual.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"

namespace ProvMark {

namespace {

const char* const IMAGE_TYPES[] = {
    "image/jpeg",
    "image/png",
    "image/gif",
    "image/webp",
    "image/bmp",
    "image/tiff",
    "image/svg+xml",
    "image/avif",
};

// basis[k][i] = scale(k) * cos(pi * (2i + 1) * k / 2n), n = 32
const std::vector<double>& dct_basis() {
    static const std::vector<double> basis = [] {
        const int n = PHASH_GRID_SIZE;
        std::vector<double> b(static_cast<size_t>(n) * n);
        const double scale = std::sqrt(2.0 / n);
        for (int k = 0; k < n; ++k) {
            const double norm = k == 0 ? scale / std::sqrt(2.0) : scale;
            for (int i = 0; i < n; ++i) {
                b[static_cast<size_t>(k) * n + i] = norm * std::cos(M_PI * (2 * i + 1) * k / (2.0 * n));
            }
        }
        return b;
    }();
    return basis;
}

void dct1d(const double* in, size_t in_stride, double* out, size_t out_stride) {
    const int n = PHASH_GRID_SIZE;
    const auto& basis = dct_basis();
    for (int k = 0; k < n; ++k) {
        double sum = 0.0;
        for (int i = 0; i < n; ++i) {
            sum += in[i * in_stride] * basis[static_cast<size_t>(k) * n + i];
        }
        out[k * out_stride] = sum;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// --- OpenCvImageDecoder ---

LuminanceMatrix OpenCvImageDecoder::decode_and_resample(const byte_vector& bytes, int target_size) const {
    if (bytes.empty()) {
        throw MalformedInput("Empty image data.");
    }
    if (target_size <= 0) {
        throw InvalidArgument("Target size must be positive.");
    }

    cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
    cv::Mat image;
    try {
        image = cv::imdecode(encoded, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw MalformedInput(std::string("Failed to decode image: ") + e.what());
    }
    if (image.empty()) {
        throw MalformedInput("Unsupported or corrupt image data.");
    }

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(target_size, target_size), 0, 0, cv::INTER_AREA);

    LuminanceMatrix out;
    out.size = target_size;
    out.values.resize(static_cast<size_t>(target_size) * target_size);
    for (int y = 0; y < target_size; ++y) {
        const cv::Vec3b* row = resized.ptr<cv::Vec3b>(y);
        for (int x = 0; x < target_size; ++x) {
            // OpenCV stores BGR
            const cv::Vec3b& px = row[x];
            out.at(y, x) = px[2] * 0.299 + px[1] * 0.587 + px[0] * 0.114;
        }
    }
    return out;
}

// --- PerceptualFingerprint ---

LuminanceMatrix PerceptualFingerprint::dct2d(const LuminanceMatrix& input) {
    const int n = PHASH_GRID_SIZE;
    if (input.size != n || input.values.size() != static_cast<size_t>(n) * n) {
        throw MalformedInput("Perceptual hash input must be a 32x32 grid.");
    }

    LuminanceMatrix rows;
    rows.size = n;
    rows.values.resize(input.values.size());
    for (int y = 0; y < n; ++y) {
        dct1d(&input.values[static_cast<size_t>(y) * n], 1, &rows.values[static_cast<size_t>(y) * n], 1);
    }

    LuminanceMatrix result;
    result.size = n;
    result.values.resize(input.values.size());
    for (int x = 0; x < n; ++x) {
        dct1d(&rows.values[x], n, &result.values[x], n);
    }
    return result;
}

std::string PerceptualFingerprint::compute(const LuminanceMatrix& luminance) {
    const LuminanceMatrix coefficients = dct2d(luminance);

    std::vector<double> low_freq;
    low_freq.reserve(PHASH_BLOCK_SIZE * PHASH_BLOCK_SIZE - 1);
    for (int y = 0; y < PHASH_BLOCK_SIZE; ++y) {
        for (int x = 0; x < PHASH_BLOCK_SIZE; ++x) {
            if (y == 0 && x == 0) {
                continue;  // DC term
            }
            low_freq.push_back(coefficients.at(y, x));
        }
    }

    std::vector<double> sorted = low_freq;
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    const double median = sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];

    // 63 coefficient bits followed by one zero padding bit, MSB first.
    uint64_t bits = 0;
    for (double value : low_freq) {
        bits = (bits << 1) | (value > median ? 1u : 0u);
    }
    bits <<= 1;

    static const char HEX[] = "0123456789abcdef";
    std::string hex(PERCEPTUAL_HASH_HEX_LENGTH, '0');
    for (size_t i = 0; i < PERCEPTUAL_HASH_HEX_LENGTH; ++i) {
        hex[i] = HEX[(bits >> (60 - 4 * i)) & 0xF];
    }
    return hex;
}

std::string PerceptualFingerprint::compute(const byte_vector& image_bytes, const ImageDecoder& decoder) {
    return compute(decoder.decode_and_resample(image_bytes, PHASH_GRID_SIZE));
}

std::optional<int> PerceptualFingerprint::hamming_distance(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return std::nullopt;
    }

    int distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        const int na = hex_value(a[i]);
        const int nb = hex_value(b[i]);
        if (na < 0 || nb < 0) {
            return std::nullopt;
        }
        unsigned int diff = static_cast<unsigned int>(na ^ nb);
        while (diff != 0) {
            distance += static_cast<int>(diff & 1u);
            diff >>= 1;
        }
    }
    return distance;
}

bool PerceptualFingerprint::is_valid(const std::string& hash) {
    return Encoding::is_lower_hex(hash, PERCEPTUAL_HASH_HEX_LENGTH);
}

bool PerceptualFingerprint::is_image_type(const std::string& content_type) {
    std::string lowered(content_type);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(std::begin(IMAGE_TYPES), std::end(IMAGE_TYPES), lowered) != std::end(IMAGE_TYPES);
}

} // namespace ProvMark
