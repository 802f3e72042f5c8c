#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "bayer_snapshot/ICamera.hpp"

namespace bayer_snapshot {

/**
 * @brief Synthetic camera producing 16-bit Bayer frames without hardware.
 *
 * Fill is either a constant value or a moving gradient scaled to the
 * configured pixel depth. `set_frames_available(false)` makes every grab
 * time out.
 */
class FakeCamera : public ICamera {
public:
    enum class Fill { Constant, Gradient };

    FakeCamera(int width = 640, int height = 480, int devices = 1);

    void set_fill(Fill fill, uint16_t value = 0) { fill_ = fill; value_ = value; }
    void set_frames_available(bool available) { frames_available_ = available; }

    int device_count() override { return devices_; }
    void open(const CameraSettings& settings) override;
    void close() override;
    void start() override;
    void stop() override;
    bool grab(RawFrame& out, int timeout_ms) override;

    std::string name() const override { return "Synthetic FakeCamera"; }
    bool is_open() const override { return open_; }
    bool is_running() const override { return running_; }

    int start_count() const { return start_count_; }
    int stop_count() const { return stop_count_; }

private:
    int width_, height_, devices_;
    CameraSettings settings_{};
    Fill fill_{Fill::Gradient};
    uint16_t value_{0};
    bool frames_available_{true};
    bool open_{false};
    bool running_{false};
    int start_count_{0};
    int stop_count_{0};
    uint64_t frame_idx_{0};
    std::chrono::steady_clock::time_point last_ts_{};
};

} // namespace bayer_snapshot
