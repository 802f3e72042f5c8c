#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace bayer_snapshot {

/**
 * @brief Encode an RGB image to disk through OpenCV.
 *
 * Extension picks the encoder. PNG takes 8- or 16-bit samples, JPEG only
 * 8-bit. Throws ImageWriteError on any failure.
 */
void write_image(const std::string& path, const cv::Mat& rgb, int jpeg_quality = 95);

/// True when the encoder for `path` stores `depth` (CV_8U / CV_16U) losslessly.
bool encoder_supports_depth(const std::string& path, int depth);

} // namespace bayer_snapshot
