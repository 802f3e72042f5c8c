#include "bayer_snapshot/ImageWriter.hpp"
#include "bayer_snapshot/CameraError.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <rclcpp/rclcpp.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace bayer_snapshot {

static std::string extension_of(const std::string& path)
{
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return "";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool encoder_supports_depth(const std::string& path, int depth)
{
    const std::string ext = extension_of(path);
    if (depth == CV_8U)
        return !ext.empty();
    if (depth == CV_16U)
        return ext == "png" || ext == "tif" || ext == "tiff";
    return false;
}

void write_image(const std::string& path, const cv::Mat& rgb, int jpeg_quality)
{
    if (rgb.empty())
        throw ImageWriteError("refusing to write empty image to " + path);
    if (!cv::haveImageWriter(path))
        throw ImageWriteError("no image encoder for " + path);
    if (!encoder_supports_depth(path, rgb.depth()))
        throw ImageWriteError("encoder for " + path + " cannot store " +
                              std::to_string(rgb.elemSize1() * 8) + "-bit samples");

    // imwrite expects BGR channel order
    cv::Mat out;
    if (rgb.channels() == 3)
        cv::cvtColor(rgb, out, cv::COLOR_RGB2BGR);
    else
        out = rgb;

    std::vector<int> params;
    const std::string ext = extension_of(path);
    if (ext == "jpg" || ext == "jpeg")
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(jpeg_quality, 0, 100)};

    bool ok = false;
    try {
        ok = cv::imwrite(path, out, params);
    } catch (const cv::Exception& e) {
        throw ImageWriteError("imwrite " + path + ": " + e.what());
    }
    if (!ok)
        throw ImageWriteError("imwrite failed for " + path);

    RCLCPP_INFO(rclcpp::get_logger("ImageWriter"), "Saved %s (%dx%d, %d-bit)",
                path.c_str(), rgb.cols, rgb.rows, static_cast<int>(rgb.elemSize1() * 8));
}

} // namespace bayer_snapshot
