#include <gtest/gtest.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "bayer_snapshot/CameraError.hpp"
#include "bayer_snapshot/CapturePipeline.hpp"
#include "bayer_snapshot/FakeCamera.hpp"

namespace fs = std::filesystem;
using namespace bayer_snapshot;

class CapturePipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("bayer_snapshot_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    PipelineConfig config(const std::string& tag = "") const
    {
        PipelineConfig cfg;
        cfg.camera.framerate = 0.0;
        cfg.timeout_ms = 10;
        cfg.png_path  = (dir_ / ("capture" + tag + ".png")).string();
        cfg.jpeg_path = (dir_ / ("capture" + tag + ".jpg")).string();
        cfg.dng_path  = (dir_ / ("capture" + tag + ".dng")).string();
        return cfg;
    }

    static std::vector<char> slurp(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        return std::vector<char>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    fs::path dir_;
};

TEST_F(CapturePipelineTest, UniformFrameEndToEnd)
{
    FakeCamera cam(4, 4);
    cam.set_fill(FakeCamera::Fill::Constant, 4096);

    CapturePipeline pipeline(cam, config());
    CaptureResult result = pipeline.run();

    ASSERT_EQ(result.rgb.type(), CV_16UC3);
    ASSERT_EQ(result.rgb.size(), cv::Size(4, 4));
    EXPECT_EQ(cv::countNonZero(result.rgb.reshape(1) != 4096), 0);

    ASSERT_EQ(result.rgb8.type(), CV_8UC3);
    EXPECT_EQ(cv::countNonZero(result.rgb8.reshape(1) != 16), 0);

    ASSERT_EQ(result.files.size(), 3u);
    for (const auto& f : result.files)
        EXPECT_TRUE(fs::exists(f)) << f;

    EXPECT_FALSE(cam.is_running());
    EXPECT_FALSE(cam.is_open());
}

TEST_F(CapturePipelineTest, EnumerateReportsDeviceCount)
{
    FakeCamera cam(4, 4, 3);
    CapturePipeline pipeline(cam, config());
    EXPECT_EQ(pipeline.enumerate(), 3);
}

TEST_F(CapturePipelineTest, NoDeviceFailsFast)
{
    FakeCamera cam(4, 4, 0);
    CapturePipeline pipeline(cam, config());
    EXPECT_EQ(pipeline.enumerate(), 0);
    EXPECT_THROW(pipeline.run(), NoDeviceError);
    EXPECT_FALSE(cam.is_running());
}

TEST_F(CapturePipelineTest, TimeoutStillStopsCapture)
{
    FakeCamera cam(4, 4);
    cam.set_frames_available(false);

    CapturePipeline pipeline(cam, config());
    pipeline.open();
    EXPECT_THROW(pipeline.acquire(), GrabTimeoutError);
    EXPECT_FALSE(cam.is_running());
    EXPECT_EQ(cam.start_count(), 1);
    EXPECT_EQ(cam.stop_count(), 1);
}

TEST_F(CapturePipelineTest, RunClosesCameraOnFailure)
{
    FakeCamera cam(4, 4);
    cam.set_frames_available(false);

    CapturePipeline pipeline(cam, config());
    EXPECT_THROW(pipeline.run(), GrabTimeoutError);
    EXPECT_FALSE(cam.is_open());
    EXPECT_FALSE(fs::exists(pipeline.config().png_path));
}

TEST_F(CapturePipelineTest, AcquireStopsCaptureAfterOneFrame)
{
    FakeCamera cam(8, 8);
    CapturePipeline pipeline(cam, config());
    pipeline.open();

    RawFrame frame = pipeline.acquire();
    EXPECT_FALSE(frame.empty());
    EXPECT_FALSE(cam.is_running());
    EXPECT_NO_THROW(cam.stop());
    EXPECT_EQ(cam.stop_count(), 1);
}

TEST_F(CapturePipelineTest, SameFrameGivesIdenticalOutput)
{
    FakeCamera cam(32, 24);
    CapturePipeline first(cam, config("_a"));
    first.open();
    RawFrame frame = first.acquire();

    CapturePipeline second(cam, config("_b"));
    CaptureResult a = first.process(frame);
    CaptureResult b = second.process(frame);

    ASSERT_EQ(a.rgb8.size(), b.rgb8.size());
    ASSERT_TRUE(a.rgb8.isContinuous() && b.rgb8.isContinuous());
    EXPECT_EQ(std::memcmp(a.rgb8.data, b.rgb8.data, a.rgb8.total() * a.rgb8.elemSize()), 0);
    EXPECT_EQ(slurp(first.config().jpeg_path), slurp(second.config().jpeg_path));
    EXPECT_EQ(slurp(first.config().png_path), slurp(second.config().png_path));
}

TEST_F(CapturePipelineTest, EmptyPathsSkipOutputs)
{
    FakeCamera cam(8, 8);
    PipelineConfig cfg = config();
    cfg.png_path.clear();
    cfg.jpeg_path.clear();
    cfg.dng_path.clear();

    CaptureResult result = CapturePipeline(cam, cfg).run();
    EXPECT_TRUE(result.files.empty());
    EXPECT_FALSE(result.rgb8.empty());
}

TEST_F(CapturePipelineTest, HalfMethodHalvesOutput)
{
    FakeCamera cam(16, 12);
    PipelineConfig cfg = config();
    cfg.method = DemosaicMethod::Half;

    CaptureResult result = CapturePipeline(cam, cfg).run();
    EXPECT_EQ(result.rgb.size(), cv::Size(8, 6));
    EXPECT_EQ(result.raw.data.size(), cv::Size(16, 12));
}

TEST_F(CapturePipelineTest, RejectsShiftOutOfRange)
{
    FakeCamera cam(4, 4);
    PipelineConfig cfg = config();
    cfg.shift_bits = 16;
    EXPECT_THROW({ CapturePipeline pipeline(cam, cfg); }, std::invalid_argument);
}

TEST_F(CapturePipelineTest, RejectsPixelDepthOutOfRange)
{
    FakeCamera cam(4, 4);
    for (int depth : {0, 17, 20, 32}) {
        PipelineConfig cfg = config();
        cfg.camera.pixel_depth = depth;
        EXPECT_THROW({ CapturePipeline pipeline(cam, cfg); }, std::invalid_argument) << depth;
    }

    PipelineConfig cfg = config();
    cfg.camera.pixel_depth = 16;
    EXPECT_NO_THROW({ CapturePipeline pipeline(cam, cfg); });
}
