#include "bayer_snapshot/SnapshotNode.hpp"
#include <lifecycle_msgs/msg/state.hpp>

// --- Choose camera backend ---
#ifdef BAYER_SNAPSHOT_WITH_XIAPI
#include "bayer_snapshot/XiCamera.hpp"       // XIMEA xiAPI
#endif
#include "bayer_snapshot/FakeCamera.hpp"     // for testing without hardware

namespace bayer_snapshot
{

SnapshotNode::SnapshotNode(const rclcpp::NodeOptions& options)
    : rclcpp_lifecycle::LifecycleNode("bayer_snapshot", options)
{
    declare_parameter<std::string>("backend", "xiapi");
    declare_parameter<int>("device_index", 0);
    declare_parameter<double>("framerate", 5.0);      // capture 5 images per second
    declare_parameter<double>("exposure_ms", 40.0);
    declare_parameter<int>("pixel_depth", 12);
    declare_parameter<int>("queue_length", 50);
    declare_parameter<int>("timeout_ms", 1000);

    declare_parameter<std::string>("bayer_pattern", "GRBG");
    declare_parameter<std::string>("demosaic", "bilinear");
    declare_parameter<int>("shift_bits", 8);
    declare_parameter<int>("jpeg_quality", 95);

    declare_parameter<std::string>("png_path", "capture.png");
    declare_parameter<std::string>("jpeg_path", "capture.jpg");
    declare_parameter<std::string>("dng_path", "");

    // fake backend geometry
    declare_parameter<int>("width", 640);
    declare_parameter<int>("height", 480);
}

PipelineConfig SnapshotNode::read_config()
{
    PipelineConfig cfg;
    cfg.camera.device_index = get_parameter("device_index").as_int();
    cfg.camera.framerate    = get_parameter("framerate").as_double();
    cfg.camera.exposure_ms  = get_parameter("exposure_ms").as_double();
    cfg.camera.pixel_depth  = get_parameter("pixel_depth").as_int();
    cfg.camera.queue_length = get_parameter("queue_length").as_int();

    cfg.pattern      = parse_bayer_pattern(get_parameter("bayer_pattern").as_string());
    cfg.method       = parse_demosaic_method(get_parameter("demosaic").as_string());
    cfg.shift_bits   = get_parameter("shift_bits").as_int();
    cfg.timeout_ms   = get_parameter("timeout_ms").as_int();
    cfg.jpeg_quality = get_parameter("jpeg_quality").as_int();

    cfg.png_path  = get_parameter("png_path").as_string();
    cfg.jpeg_path = get_parameter("jpeg_path").as_string();
    cfg.dng_path  = get_parameter("dng_path").as_string();
    return cfg;
}

bool SnapshotNode::take_snapshot()
{
    using lifecycle_msgs::msg::State;

    if (configure().id() != State::PRIMARY_STATE_INACTIVE)
        return false;

    bool ok = activate().id() == State::PRIMARY_STATE_ACTIVE;
    if (ok)
        ok = deactivate().id() == State::PRIMARY_STATE_INACTIVE;
    cleanup();
    return ok;
}

SnapshotNode::CallbackReturn
SnapshotNode::on_configure(const rclcpp_lifecycle::State &)
{
    std::string backend = get_parameter("backend").as_string();

    try {
        PipelineConfig cfg = read_config();

        if (backend == "xiapi") {
#ifdef BAYER_SNAPSHOT_WITH_XIAPI
            camera_ = std::make_shared<XiCamera>();
#else
            RCLCPP_ERROR(get_logger(), "Built without XIMEA xiAPI support");
            return CallbackReturn::FAILURE;
#endif
        } else if (backend == "fake") {
            camera_ = std::make_shared<FakeCamera>(
                get_parameter("width").as_int(), get_parameter("height").as_int());
        } else {
            RCLCPP_ERROR(get_logger(), "Unknown backend '%s' (xiapi|fake)", backend.c_str());
            return CallbackReturn::FAILURE;
        }

        pipeline_ = std::make_unique<CapturePipeline>(*camera_, cfg);
        pipeline_->enumerate();
        pipeline_->open();

        RCLCPP_INFO(get_logger(), "Configured %s backend: %s, pattern %s, %s demosaic",
                    backend.c_str(), camera_->name().c_str(),
                    to_string(cfg.pattern).c_str(), to_string(cfg.method).c_str());
        return CallbackReturn::SUCCESS;
    } catch (const std::exception& e) {
        RCLCPP_ERROR(get_logger(), "Camera open failed: %s", e.what());
        pipeline_.reset();
        if (camera_) camera_->close();
        camera_.reset();
        return CallbackReturn::FAILURE;
    }
}

SnapshotNode::CallbackReturn
SnapshotNode::on_activate(const rclcpp_lifecycle::State &)
{
    if (!camera_ || !pipeline_) {
        RCLCPP_ERROR(get_logger(), "Camera not configured.");
        return CallbackReturn::FAILURE;
    }

    try {
        result_ = pipeline_->process(pipeline_->acquire());
    } catch (const std::exception& e) {
        RCLCPP_ERROR(get_logger(), "Capture failed: %s", e.what());
        return CallbackReturn::FAILURE;
    }

    for (const auto& f : result_.files)
        RCLCPP_INFO(get_logger(), "Wrote %s", f.c_str());
    return CallbackReturn::SUCCESS;
}

SnapshotNode::CallbackReturn
SnapshotNode::on_deactivate(const rclcpp_lifecycle::State &)
{
    if (camera_) camera_->stop();
    RCLCPP_INFO(get_logger(), "Capture stopped.");
    return CallbackReturn::SUCCESS;
}

SnapshotNode::CallbackReturn
SnapshotNode::on_cleanup(const rclcpp_lifecycle::State &)
{
    pipeline_.reset();
    if (camera_) camera_->close();
    camera_.reset();
    RCLCPP_INFO(get_logger(), "Camera closed.");
    return CallbackReturn::SUCCESS;
}

SnapshotNode::CallbackReturn
SnapshotNode::on_shutdown(const rclcpp_lifecycle::State & state)
{
    return on_cleanup(state);
}

}  // namespace bayer_snapshot
