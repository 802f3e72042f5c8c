#pragma once
#include <cstddef>
#include <string>
#include <cstdint>
#include <opencv2/core.hpp>

namespace bayer_snapshot {

/**
 * @brief Device configuration applied once at open time.
 */
struct CameraSettings {
  int device_index = 0;
  double framerate = 5.0;     // frames per second
  double exposure_ms = 40.0;  // exposure time in milliseconds
  int pixel_depth = 12;       // significant bits per sample
  int queue_length = 50;      // images held by the SDK queue
};

struct FrameMeta {
  uint64_t timestamp_ns = 0;
  uint64_t frame_index = 0;
  uint32_t exposure_us = 0;
  double framerate = 0.0;
  int pixel_depth = 0;
};

/// One Bayer-mosaiced sensor frame (CV_16UC1, owns its pixels).
struct RawFrame {
  cv::Mat data;
  FrameMeta meta;

  int width() const { return data.cols; }
  int height() const { return data.rows; }
  bool empty() const { return data.empty(); }
};

class ICamera {
public:
  virtual ~ICamera() = default;

  virtual int device_count() = 0;
  virtual void open(const CameraSettings& settings) = 0;
  virtual void close() = 0;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual bool grab(RawFrame& out, int timeout_ms) = 0;

  virtual std::string name() const = 0;
  virtual bool is_open() const = 0;
  virtual bool is_running() const = 0;
};

} // namespace bayer_snapshot
