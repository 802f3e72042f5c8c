#pragma once
#include <stdexcept>
#include <string>

namespace bayer_snapshot {

/**
 * @brief Failure reported by a camera backend.
 *
 * Carries the SDK status code; 0 when the failure did not come from the SDK.
 */
class CameraError : public std::runtime_error {
public:
    explicit CameraError(const std::string& what, int code = 0)
        : std::runtime_error(what), code_(code) {}

    CameraError(const std::string& call, int code, const std::string& detail)
        : std::runtime_error(call + " failed: SDK error " + std::to_string(code) +
                             (detail.empty() ? "" : " (" + detail + ")")),
          code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/// No camera present, or the requested device index does not exist.
class NoDeviceError : public CameraError {
public:
    using CameraError::CameraError;
};

/// The blocking frame fetch returned without a frame.
class GrabTimeoutError : public CameraError {
public:
    using CameraError::CameraError;
};

/// Output file could not be encoded or written.
class ImageWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace bayer_snapshot
