#include <m3api/xiApi.h>
#include "bayer_snapshot/XiCamera.hpp"
#include "bayer_snapshot/CameraError.hpp"
#include <rclcpp/rclcpp.hpp>
#include <cstring>
#include <stdexcept>

namespace bayer_snapshot {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("XiCamera"); }
}

int XiCamera::device_count()
{
    DWORD count = 0;
    XI_RETURN stat = xiGetNumberDevices(&count);
    if (stat != XI_OK)
        throw CameraError("xiGetNumberDevices", stat, "");
    return static_cast<int>(count);
}

void XiCamera::set_int(const char* prm, int value)
{
    XI_RETURN stat = xiSetParamInt(handle_, prm, value);
    if (stat != XI_OK)
        throw CameraError("xiSetParamInt", stat, prm);
}

void XiCamera::set_float(const char* prm, float value)
{
    XI_RETURN stat = xiSetParamFloat(handle_, prm, value);
    if (stat != XI_OK)
        throw CameraError("xiSetParamFloat", stat, prm);
}

void XiCamera::open(const CameraSettings& settings)
{
    if (handle_) close();
    if (settings.pixel_depth < 1 || settings.pixel_depth > 16)
        throw std::invalid_argument("pixel_depth must be in [1, 16]");

    int count = device_count();
    if (count == 0)
        throw NoDeviceError("no XIMEA camera found");
    if (settings.device_index < 0 || settings.device_index >= count)
        throw NoDeviceError("device index " + std::to_string(settings.device_index) +
                            " out of range (" + std::to_string(count) + " devices)");

    XI_RETURN stat = xiOpenDevice(static_cast<DWORD>(settings.device_index), &handle_);
    if (stat != XI_OK) {
        handle_ = nullptr;
        throw CameraError("xiOpenDevice", stat, "");
    }
    settings_ = settings;

    std::memset(&image_, 0, sizeof(image_));
    image_.size = sizeof(XI_IMG);

    try {
        char buf[256] = {0};
        if (xiGetParamString(handle_, XI_PRM_DEVICE_NAME, buf, sizeof(buf)) == XI_OK)
            name_ = std::string("XIMEA ") + buf;
        else
            name_ = "XIMEA camera";

        // RAW16 keeps the full sensor depth, LSB aligned
        set_int(XI_PRM_IMAGE_DATA_FORMAT, XI_RAW16);
        set_int(XI_PRM_OUTPUT_DATA_BIT_DEPTH, settings.pixel_depth);
        set_int(XI_PRM_EXPOSURE, static_cast<int>(settings.exposure_ms * 1000.0));
        set_int(XI_PRM_ACQ_TIMING_MODE, XI_ACQ_TIMING_MODE_FRAME_RATE);
        set_float(XI_PRM_FRAMERATE, static_cast<float>(settings.framerate));
        set_int(XI_PRM_BUFFERS_QUEUE_SIZE, settings.queue_length);
    } catch (...) {
        close();
        throw;
    }

    RCLCPP_INFO(logger(), "Opened %s (index %d): %.1f fps, %.1f ms exposure, %d-bit",
                name_.c_str(), settings.device_index, settings.framerate,
                settings.exposure_ms, settings.pixel_depth);
}

void XiCamera::start()
{
    if (!handle_) throw CameraError("XiCamera not opened");
    if (running_) return;
    XI_RETURN stat = xiStartAcquisition(handle_);
    if (stat != XI_OK)
        throw CameraError("xiStartAcquisition", stat, "");
    running_ = true;
}

void XiCamera::stop()
{
    if (!running_) return;
    running_ = false;
    XI_RETURN stat = xiStopAcquisition(handle_);
    if (stat != XI_OK)
        RCLCPP_WARN(logger(), "xiStopAcquisition returned %d", stat);
}

void XiCamera::close()
{
    stop();
    if (handle_) {
        xiCloseDevice(handle_);
        handle_ = nullptr;
    }
}

bool XiCamera::grab(RawFrame& out, int timeout_ms)
{
    if (!running_) return false;

    XI_RETURN stat = xiGetImage(handle_, timeout_ms, &image_);
    if (stat == XI_TIMEOUT) return false;
    if (stat != XI_OK)
        throw CameraError("xiGetImage", stat, "");

    // padding_x is in bytes; copy out of the SDK buffer before the next grab
    const size_t stride = image_.width * sizeof(uint16_t) + image_.padding_x;
    cv::Mat view(static_cast<int>(image_.height), static_cast<int>(image_.width),
                 CV_16UC1, image_.bp, stride);
    out.data = view.clone();

    out.meta.timestamp_ns = static_cast<uint64_t>(image_.tsSec) * 1'000'000'000ULL +
                            static_cast<uint64_t>(image_.tsUSec) * 1000ULL;
    out.meta.frame_index = image_.nframe;
    out.meta.exposure_us = image_.exposure_time_us;
    out.meta.framerate = settings_.framerate;
    out.meta.pixel_depth = settings_.pixel_depth;
    return true;
}

} // namespace bayer_snapshot
