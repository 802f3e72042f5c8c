#pragma once

#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <memory>

#include "bayer_snapshot/ICamera.hpp"
#include "bayer_snapshot/CapturePipeline.hpp"

namespace bayer_snapshot
{

/**
 * @brief Lifecycle node that takes one snapshot.
 *
 * When configured, it opens and configures the camera.
 * When activated, it grabs one frame and writes the output files.
 * When deactivated, capture is stopped; cleanup closes the device.
 */
class SnapshotNode : public rclcpp_lifecycle::LifecycleNode
{
public:
    explicit SnapshotNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

    using CallbackReturn =
        rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

    /// configure -> activate -> deactivate -> cleanup; true if every step succeeded.
    bool take_snapshot();

    const CaptureResult& result() const { return result_; }

protected:
    CallbackReturn on_configure(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_activate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_shutdown(const rclcpp_lifecycle::State &) override;

private:
    PipelineConfig read_config();

    std::shared_ptr<ICamera> camera_;
    std::unique_ptr<CapturePipeline> pipeline_;
    CaptureResult result_;
};

}  // namespace bayer_snapshot
