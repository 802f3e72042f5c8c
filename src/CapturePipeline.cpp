#include "bayer_snapshot/CapturePipeline.hpp"
#include "bayer_snapshot/AcquisitionGuard.hpp"
#include "bayer_snapshot/CameraError.hpp"
#include "bayer_snapshot/DngWriter.hpp"
#include "bayer_snapshot/ImageWriter.hpp"
#include <rclcpp/rclcpp.hpp>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace bayer_snapshot {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("CapturePipeline"); }
}

CapturePipeline::CapturePipeline(ICamera& camera, PipelineConfig config)
    : camera_(camera), config_(std::move(config))
{
    if (config_.shift_bits < 0 || config_.shift_bits > 15)
        throw std::invalid_argument("shift_bits must be in [0, 15]");
    if (config_.camera.pixel_depth < 1 || config_.camera.pixel_depth > 16)
        throw std::invalid_argument("pixel_depth must be in [1, 16]");
}

int CapturePipeline::enumerate()
{
    int n = camera_.device_count();
    RCLCPP_INFO(logger(), "Number of cameras found: %d", n);
    return n;
}

void CapturePipeline::open()
{
    camera_.open(config_.camera);
}

RawFrame CapturePipeline::acquire()
{
    RawFrame frame;
    AcquisitionGuard capture(camera_);

    auto t0 = std::chrono::steady_clock::now();
    bool ok = camera_.grab(frame, config_.timeout_ms);
    double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    capture.release();

    if (!ok || frame.empty())
        throw GrabTimeoutError("no frame from " + camera_.name() + " within " +
                               std::to_string(config_.timeout_ms) + " ms");

    RCLCPP_INFO(logger(), "Frame %lu: %dx%d, exposure %u us, grab %.1f ms",
                static_cast<unsigned long>(frame.meta.frame_index),
                frame.width(), frame.height(), frame.meta.exposure_us, ms);
    return frame;
}

CaptureResult CapturePipeline::process(const RawFrame& frame) const
{
    CaptureResult result;
    result.raw = frame;

    if (!config_.dng_path.empty()) {
        write_dng(config_.dng_path, frame, camera_.name(), config_.pattern);
        result.files.push_back(config_.dng_path);
    }

    result.rgb = demosaic(frame.data, config_.pattern, config_.method);

    if (!config_.png_path.empty()) {
        write_image(config_.png_path, result.rgb, config_.jpeg_quality);
        result.files.push_back(config_.png_path);
    }

    result.rgb8 = reduce_bit_depth(result.rgb, config_.shift_bits);

    if (!config_.jpeg_path.empty()) {
        write_image(config_.jpeg_path, result.rgb8, config_.jpeg_quality);
        result.files.push_back(config_.jpeg_path);
    }
    return result;
}

CaptureResult CapturePipeline::run()
{
    enumerate();
    open();
    try {
        CaptureResult result = process(acquire());
        camera_.close();
        return result;
    } catch (...) {
        camera_.close();
        throw;
    }
}

} // namespace bayer_snapshot
