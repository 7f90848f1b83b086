#ifndef PROVMARK_PERCEPTUAL_HPP
#define PROVMARK_PERCEPTUAL_HPP

#include "keys.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ProvMark {

    constexpr int PHASH_GRID_SIZE = 32;
    constexpr int PHASH_BLOCK_SIZE = 8;
    constexpr size_t PERCEPTUAL_HASH_HEX_LENGTH = 16;
    constexpr int DEFAULT_SIMILARITY_THRESHOLD = 10;

    /**
     * @brief Square single-channel image, row-major, values in [0, 255].
     */
    struct LuminanceMatrix {
        int size = 0;
        std::vector<double> values;

        double at(int y, int x) const { return values[static_cast<size_t>(y) * size + x]; }
        double& at(int y, int x) { return values[static_cast<size_t>(y) * size + x]; }
    };

    /**
     * @brief Capability for turning encoded image bytes into a small luminance grid.
     */
    class ImageDecoder {
    public:
        virtual ~ImageDecoder() = default;

        /**
         * @brief Decodes an image of any resolution and color space and resamples it.
         * @param bytes The encoded image (PNG, JPEG, ...).
         * @param target_size Width and height of the returned grid.
         * @throws ProvMark::MalformedInput if the bytes are not a decodable image.
         */
        virtual LuminanceMatrix decode_and_resample(const byte_vector& bytes, int target_size) const = 0;
    };

    /**
     * @brief ImageDecoder backed by OpenCV (imgcodecs + area resampling).
     *
     * Luminance is 0.299 R + 0.587 G + 0.114 B over the resampled 8-bit
     * pixels. Alpha is discarded.
     */
    class OpenCvImageDecoder : public ImageDecoder {
    public:
        LuminanceMatrix decode_and_resample(const byte_vector& bytes, int target_size) const override;
    };

    /**
     * @brief 64-bit DCT perceptual hash and its distance metric.
     */
    class PerceptualFingerprint {
    public:
        /**
         * @brief Hash of a 32x32 luminance grid as 16 lowercase hex characters.
         * @throws ProvMark::MalformedInput if the grid is not 32x32.
         */
        static std::string compute(const LuminanceMatrix& luminance);

        /**
         * @brief Decodes, resamples and hashes an encoded image.
         */
        static std::string compute(const byte_vector& image_bytes, const ImageDecoder& decoder);

        /**
         * @brief Orthonormal 2-D DCT-II (rows first, then columns).
         */
        static LuminanceMatrix dct2d(const LuminanceMatrix& input);

        /**
         * @brief Number of differing bits between two hex digests.
         * @return std::nullopt when the digests cannot be compared
         *         (different lengths or non-hex characters).
         */
        static std::optional<int> hamming_distance(const std::string& a, const std::string& b);

        /**
         * @brief True for 16 lowercase hex characters.
         */
        static bool is_valid(const std::string& hash);

        /**
         * @brief True for the content types a perceptual hash is computed for.
         */
        static bool is_image_type(const std::string& content_type);
    };

} // namespace ProvMark

#endif // PROVMARK_PERCEPTUAL_HPP
