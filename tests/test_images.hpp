#ifndef PROVMARK_TEST_IMAGES_HPP
#define PROVMARK_TEST_IMAGES_HPP

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <string>
#include <vector>

#include "provmark/keys.hpp"

namespace ProvMark {
namespace test {

    /**
     * @brief A grey image built from the 63 low-frequency DCT basis patterns, each
     *        with a distinct amplitude, so every perceptual-hash bit has a clear margin.
     *        `variant` permutes the amplitudes; `inverted` negates the pattern.
     */
    inline cv::Mat make_pattern_image(int width, int height, int variant = 0, bool inverted = false) {
        // Multipliers coprime to 63, so each variant is a permutation of the ranks.
        static const int MULTIPLIERS[] = {37, 41, 38, 40};
        const int multiplier = MULTIPLIERS[variant % 4];

        std::vector<double> amplitude(64, 0.0);
        for (int idx = 1; idx < 64; ++idx) {
            int rank = ((idx - 1) * multiplier) % 63;
            amplitude[idx] = (rank - 31) * 0.4;
        }

        cv::Mat gray(height, width, CV_8UC1);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                double value = 0.0;
                for (int v = 0; v < 8; ++v) {
                    const double cy = std::cos(M_PI * (2 * y + 1) * v / (2.0 * height));
                    for (int u = 0; u < 8; ++u) {
                        if (u == 0 && v == 0) {
                            continue;
                        }
                        value += amplitude[v * 8 + u] * cy * std::cos(M_PI * (2 * x + 1) * u / (2.0 * width));
                    }
                }
                gray.at<uint8_t>(y, x) = cv::saturate_cast<uint8_t>(128.0 + (inverted ? -value : value));
            }
        }

        cv::Mat bgr;
        cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    }

    inline byte_vector encode(const cv::Mat& image, const std::string& ext, std::vector<int> params = {}) {
        std::vector<uint8_t> buffer;
        cv::imencode(ext, image, buffer, params);
        return byte_vector(buffer.begin(), buffer.end());
    }

    inline byte_vector encode_png(const cv::Mat& image) {
        return encode(image, ".png");
    }

    inline byte_vector encode_jpeg(const cv::Mat& image, int quality) {
        return encode(image, ".jpg", {cv::IMWRITE_JPEG_QUALITY, quality});
    }

} // namespace test
} // namespace ProvMark

#endif // PROVMARK_TEST_IMAGES_HPP
