#pragma once
#include "bayer_snapshot/ICamera.hpp"
#include <m3api/xiApi.h>
#include <cstdint>
#include <cstddef>
#include <string>

namespace bayer_snapshot {

/**
 * @brief XIMEA xiAPI backend delivering RAW16 Bayer frames.
 */
class XiCamera : public ICamera {
public:
    XiCamera() = default;
    ~XiCamera() override { close(); }

    XiCamera(const XiCamera&) = delete;
    XiCamera& operator=(const XiCamera&) = delete;

    int device_count() override;
    void open(const CameraSettings& settings) override;
    void start() override;
    void stop() override;
    void close() override;
    bool grab(RawFrame& out, int timeout_ms) override;

    std::string name() const override { return name_; }
    bool is_open() const override { return handle_ != nullptr; }
    bool is_running() const override { return running_; }

private:
    void set_int(const char* prm, int value);
    void set_float(const char* prm, float value);

    HANDLE handle_{nullptr};
    XI_IMG image_{};
    CameraSettings settings_{};
    std::string name_;
    bool running_{false};
};

} // namespace bayer_snapshot
