#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <lifecycle_msgs/msg/state.hpp>
#include <rclcpp/rclcpp.hpp>

#include "bayer_snapshot/SnapshotNode.hpp"

namespace fs = std::filesystem;
using bayer_snapshot::SnapshotNode;
using lifecycle_msgs::msg::State;

class SnapshotNodeTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
    static void TearDownTestSuite() { rclcpp::shutdown(); }

    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("bayer_snapshot_node_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    // fake 4x4 camera writing into the test directory
    std::vector<rclcpp::Parameter> fake_params() const
    {
        return {
            rclcpp::Parameter("backend", std::string("fake")),
            rclcpp::Parameter("width", 4),
            rclcpp::Parameter("height", 4),
            rclcpp::Parameter("framerate", 0.0),
            rclcpp::Parameter("timeout_ms", 100),
            rclcpp::Parameter("png_path", path("capture.png")),
            rclcpp::Parameter("jpeg_path", path("capture.jpg")),
            rclcpp::Parameter("dng_path", path("capture.dng")),
        };
    }

    static std::vector<rclcpp::Parameter> with(std::vector<rclcpp::Parameter> params,
                                               const rclcpp::Parameter& p)
    {
        for (auto& q : params)
            if (q.get_name() == p.get_name()) { q = p; return params; }
        params.push_back(p);
        return params;
    }

    std::shared_ptr<SnapshotNode> make_node(std::vector<rclcpp::Parameter> params) const
    {
        return std::make_shared<SnapshotNode>(
            rclcpp::NodeOptions().parameter_overrides(params));
    }

    fs::path dir_;
};

TEST_F(SnapshotNodeTest, DefaultsMatchCaptureConstants)
{
    auto node = make_node({});
    EXPECT_EQ(node->get_parameter("backend").as_string(), "xiapi");
    EXPECT_DOUBLE_EQ(node->get_parameter("framerate").as_double(), 5.0);
    EXPECT_DOUBLE_EQ(node->get_parameter("exposure_ms").as_double(), 40.0);
    EXPECT_EQ(node->get_parameter("bayer_pattern").as_string(), "GRBG");
    EXPECT_EQ(node->get_parameter("shift_bits").as_int(), 8);
    EXPECT_EQ(node->get_parameter("png_path").as_string(), "capture.png");
    EXPECT_EQ(node->get_parameter("jpeg_path").as_string(), "capture.jpg");
}

TEST_F(SnapshotNodeTest, FakeBackendSnapshotWritesFiles)
{
    auto node = make_node(fake_params());
    ASSERT_TRUE(node->take_snapshot());

    EXPECT_EQ(node->get_current_state().id(), State::PRIMARY_STATE_UNCONFIGURED);
    EXPECT_EQ(node->result().files.size(), 3u);
    EXPECT_TRUE(fs::exists(path("capture.png")));
    EXPECT_TRUE(fs::exists(path("capture.jpg")));
    EXPECT_TRUE(fs::exists(path("capture.dng")));
    EXPECT_EQ(node->result().rgb8.size(), cv::Size(4, 4));
}

TEST_F(SnapshotNodeTest, TransitionsStepByStep)
{
    auto node = make_node(fake_params());
    EXPECT_EQ(node->configure().id(), State::PRIMARY_STATE_INACTIVE);
    EXPECT_EQ(node->activate().id(), State::PRIMARY_STATE_ACTIVE);
    EXPECT_EQ(node->deactivate().id(), State::PRIMARY_STATE_INACTIVE);
    EXPECT_EQ(node->cleanup().id(), State::PRIMARY_STATE_UNCONFIGURED);
}

TEST_F(SnapshotNodeTest, UnknownBackendFailsConfigure)
{
    auto node = make_node(with(fake_params(), rclcpp::Parameter("backend", std::string("bogus"))));

    EXPECT_EQ(node->configure().id(), State::PRIMARY_STATE_UNCONFIGURED);
    EXPECT_FALSE(node->take_snapshot());
    EXPECT_FALSE(fs::exists(path("capture.png")));
}

TEST_F(SnapshotNodeTest, BadBayerPatternFailsConfigure)
{
    auto node = make_node(with(fake_params(), rclcpp::Parameter("bayer_pattern", std::string("XYZW"))));

    EXPECT_EQ(node->configure().id(), State::PRIMARY_STATE_UNCONFIGURED);
}

TEST_F(SnapshotNodeTest, BadPixelDepthFailsConfigure)
{
    auto node = make_node(with(fake_params(), rclcpp::Parameter("pixel_depth", 32)));

    EXPECT_FALSE(node->take_snapshot());
    EXPECT_EQ(node->get_current_state().id(), State::PRIMARY_STATE_UNCONFIGURED);
}

TEST_F(SnapshotNodeTest, WriteFailureFailsActivateAndStillCleansUp)
{
    auto node = make_node(with(fake_params(), rclcpp::Parameter("jpeg_path", path("capture.nope"))));

    // writer rejects the extension after the grab
    EXPECT_FALSE(node->take_snapshot());
    EXPECT_EQ(node->get_current_state().id(), State::PRIMARY_STATE_UNCONFIGURED);
}
