#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace bayer_snapshot {

// pattern: colors of the top-left 2x2 block, row by row
enum class BayerPattern { RGGB, GRBG, GBRG, BGGR };

enum class DemosaicMethod { Bilinear, Half };

/// Parse "GRBG", "rggb", ... Throws std::invalid_argument on anything else.
BayerPattern parse_bayer_pattern(const std::string& s);
std::string to_string(BayerPattern pattern);

DemosaicMethod parse_demosaic_method(const std::string& s);
std::string to_string(DemosaicMethod method);

/// OpenCV color conversion code used for a pattern.
int opencv_bayer_code(BayerPattern pattern);

/// Full resolution bilinear demosaic, 1 channel -> RGB, depth preserved.
cv::Mat demosaic(const cv::Mat& raw, BayerPattern pattern);

/// 2x2 binning demosaic, output is half width and height, depth preserved.
cv::Mat demosaic_half(const cv::Mat& raw, BayerPattern pattern);

cv::Mat demosaic(const cv::Mat& raw, BayerPattern pattern, DemosaicMethod method);

/**
 * @brief Right-shift every sample into 8 bits.
 *
 * out = saturate(in >> shift). Accepts 8- or 16-bit unsigned input of any
 * channel count; shift must lie in [0, 15].
 */
cv::Mat reduce_bit_depth(const cv::Mat& src, int shift);

} // namespace bayer_snapshot
