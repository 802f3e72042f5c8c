#include "bayer_snapshot/FakeCamera.hpp"
#include "bayer_snapshot/CameraError.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace std::chrono;

namespace bayer_snapshot {

FakeCamera::FakeCamera(int w, int h, int devices)
    : width_(w), height_(h), devices_(std::max(devices, 0))
{}

void FakeCamera::open(const CameraSettings& settings)
{
    if (settings.pixel_depth < 1 || settings.pixel_depth > 16)
        throw std::invalid_argument("pixel_depth must be in [1, 16]");
    if (devices_ == 0)
        throw NoDeviceError("no camera found");
    if (settings.device_index < 0 || settings.device_index >= devices_)
        throw NoDeviceError("device index " + std::to_string(settings.device_index) +
                            " out of range (" + std::to_string(devices_) + " devices)");
    settings_ = settings;
    open_ = true;
    running_ = false;
}

void FakeCamera::close()
{
    stop();
    open_ = false;
}

void FakeCamera::start()
{
    if (!open_) throw CameraError("FakeCamera not opened");
    if (running_) return;
    running_ = true;
    start_count_++;
    last_ts_ = steady_clock::now();
}

void FakeCamera::stop()
{
    if (!running_) return;
    running_ = false;
    stop_count_++;
}

bool FakeCamera::grab(RawFrame& out, int timeout_ms)
{
    if (!running_) return false;
    if (!frames_available_) {
        std::this_thread::sleep_for(milliseconds(std::max(timeout_ms, 0)));
        return false;
    }

    if (settings_.framerate > 0.0) {
        auto period = duration_cast<milliseconds>(duration<double>(1.0 / settings_.framerate));
        auto dt = duration_cast<milliseconds>(steady_clock::now() - last_ts_);
        if (frame_idx_ > 0 && dt < period) std::this_thread::sleep_for(period - dt);
    }
    last_ts_ = steady_clock::now();

    const int max_value = (1 << settings_.pixel_depth) - 1;
    cv::Mat img(height_, width_, CV_16UC1);
    if (fill_ == Fill::Constant) {
        img.setTo(cv::Scalar(value_));
    } else {
        // simple moving gradient spanning the pixel depth
        const int span = std::max(width_ + height_, 1);
        for (int y = 0; y < height_; ++y) {
            uint16_t* row = img.ptr<uint16_t>(y);
            for (int x = 0; x < width_; ++x)
                row[x] = static_cast<uint16_t>(
                    ((x + y + frame_idx_) % span) * max_value / span);
        }
    }

    out.data = img;
    out.meta.timestamp_ns = duration_cast<nanoseconds>(
        steady_clock::now().time_since_epoch()).count();
    out.meta.frame_index = frame_idx_++;
    out.meta.exposure_us = static_cast<uint32_t>(settings_.exposure_ms * 1000.0);
    out.meta.framerate = settings_.framerate;
    out.meta.pixel_depth = settings_.pixel_depth;
    return true;
}

} // namespace bayer_snapshot
