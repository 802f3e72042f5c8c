#pragma once
#include "bayer_snapshot/ICamera.hpp"

namespace bayer_snapshot {

/**
 * @brief Scoped continuous capture.
 *
 * Starts acquisition on construction and stops it when the guard goes out
 * of scope, so a throwing grab still leaves the camera idle.
 */
class AcquisitionGuard {
public:
    explicit AcquisitionGuard(ICamera& camera) : camera_(&camera) { camera_->start(); }
    ~AcquisitionGuard() { release(); }

    AcquisitionGuard(const AcquisitionGuard&) = delete;
    AcquisitionGuard& operator=(const AcquisitionGuard&) = delete;

    /// Stop capture now instead of at scope exit.
    void release()
    {
        if (camera_) {
            ICamera* cam = camera_;
            camera_ = nullptr;
            cam->stop();
        }
    }

private:
    ICamera* camera_;
};

} // namespace bayer_snapshot
