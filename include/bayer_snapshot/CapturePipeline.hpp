#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "bayer_snapshot/ICamera.hpp"
#include "bayer_snapshot/Debayer.hpp"

namespace bayer_snapshot {

struct PipelineConfig {
    CameraSettings camera;
    BayerPattern pattern = BayerPattern::GRBG;
    DemosaicMethod method = DemosaicMethod::Bilinear;
    int shift_bits = 8;
    int timeout_ms = 1000;
    int jpeg_quality = 95;

    // empty path skips that output
    std::string png_path = "capture.png";
    std::string jpeg_path = "capture.jpg";
    std::string dng_path;
};

struct CaptureResult {
    RawFrame raw;
    cv::Mat rgb;    // source depth
    cv::Mat rgb8;   // after the right-shift
    std::vector<std::string> files;
};

/**
 * @brief Single-shot acquire / demosaic / save sequence.
 *
 * The camera is borrowed; the pipeline never outlives it. Acquisition is
 * scoped so continuous capture is off again whether or not a frame arrives.
 */
class CapturePipeline {
public:
    CapturePipeline(ICamera& camera, PipelineConfig config);

    int enumerate();
    void open();
    RawFrame acquire();
    CaptureResult process(const RawFrame& frame) const;

    /// enumerate, open, acquire, process, close.
    CaptureResult run();

    const PipelineConfig& config() const { return config_; }

private:
    ICamera& camera_;
    PipelineConfig config_;
};

} // namespace bayer_snapshot
