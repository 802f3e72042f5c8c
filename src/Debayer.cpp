#include "bayer_snapshot/Debayer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bayer_snapshot {

BayerPattern parse_bayer_pattern(const std::string& s)
{
    std::string up(s);
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if      (up == "RGGB") return BayerPattern::RGGB;
    else if (up == "GRBG") return BayerPattern::GRBG;
    else if (up == "GBRG") return BayerPattern::GBRG;
    else if (up == "BGGR") return BayerPattern::BGGR;
    throw std::invalid_argument("unknown Bayer pattern: " + s);
}

std::string to_string(BayerPattern pattern)
{
    switch (pattern) {
    case BayerPattern::RGGB: return "RGGB";
    case BayerPattern::GRBG: return "GRBG";
    case BayerPattern::GBRG: return "GBRG";
    case BayerPattern::BGGR: return "BGGR";
    }
    return "?";
}

DemosaicMethod parse_demosaic_method(const std::string& s)
{
    if (s == "bilinear") return DemosaicMethod::Bilinear;
    if (s == "half")     return DemosaicMethod::Half;
    throw std::invalid_argument("unknown demosaic method: " + s);
}

std::string to_string(DemosaicMethod method)
{
    return method == DemosaicMethod::Half ? "half" : "bilinear";
}

int opencv_bayer_code(BayerPattern pattern)
{
    switch (pattern) {
    case BayerPattern::RGGB: return cv::COLOR_BayerRG2RGB;
    case BayerPattern::GRBG: return cv::COLOR_BayerGR2RGB;
    case BayerPattern::GBRG: return cv::COLOR_BayerGB2RGB;
    case BayerPattern::BGGR: return cv::COLOR_BayerBG2RGB;
    }
    throw std::invalid_argument("bad Bayer pattern");
}

static void check_mosaic(const cv::Mat& raw)
{
    if (raw.empty())
        throw std::invalid_argument("demosaic: empty frame");
    if (raw.type() != CV_16UC1 && raw.type() != CV_8UC1)
        throw std::invalid_argument("demosaic: expected a single channel 8- or 16-bit mosaic");
}

cv::Mat demosaic(const cv::Mat& raw, BayerPattern pattern)
{
    check_mosaic(raw);
    cv::Mat rgb;
    cv::cvtColor(raw, rgb, opencv_bayer_code(pattern));
    return rgb;
}

// ----------------------------------------------------
// 2x2 DebayerHalfColor: one RGB pixel per CFA block
// ----------------------------------------------------
template <typename T>
static void debayer_half_color(const cv::Mat& src, cv::Mat& dst, BayerPattern pattern)
{
    const int dst_w = src.cols / 2;
    const int dst_h = src.rows / 2;

    for (int y = 0; y < dst_h; ++y) {
        const T* row0 = src.ptr<T>(2 * y);
        const T* row1 = src.ptr<T>(2 * y + 1);
        T* out = dst.ptr<T>(y);

        for (int x = 0; x < dst_w; ++x) {
            const T tl = row0[2 * x], tr = row0[2 * x + 1];
            const T bl = row1[2 * x], br = row1[2 * x + 1];
            T r, g, b;

            switch (pattern) {
            case BayerPattern::RGGB: // R G / G B
                r = tl; b = br;
                g = static_cast<T>((int(tr) + int(bl)) / 2);
                break;
            case BayerPattern::GRBG: // G R / B G
                r = tr; b = bl;
                g = static_cast<T>((int(tl) + int(br)) / 2);
                break;
            case BayerPattern::GBRG: // G B / R G
                r = bl; b = tr;
                g = static_cast<T>((int(tl) + int(br)) / 2);
                break;
            case BayerPattern::BGGR: // B G / G R
            default:
                r = br; b = tl;
                g = static_cast<T>((int(tr) + int(bl)) / 2);
                break;
            }

            out[3 * x + 0] = r;
            out[3 * x + 1] = g;
            out[3 * x + 2] = b;
        }
    }
}

cv::Mat demosaic_half(const cv::Mat& raw, BayerPattern pattern)
{
    check_mosaic(raw);
    if (raw.cols < 2 || raw.rows < 2)
        throw std::invalid_argument("demosaic_half: frame smaller than one CFA block");

    cv::Mat rgb(raw.rows / 2, raw.cols / 2, CV_MAKETYPE(raw.depth(), 3));
    if (raw.depth() == CV_16U)
        debayer_half_color<uint16_t>(raw, rgb, pattern);
    else
        debayer_half_color<uint8_t>(raw, rgb, pattern);
    return rgb;
}

cv::Mat demosaic(const cv::Mat& raw, BayerPattern pattern, DemosaicMethod method)
{
    return method == DemosaicMethod::Half ? demosaic_half(raw, pattern)
                                          : demosaic(raw, pattern);
}

template <typename T>
static void shift_to_8bit(const cv::Mat& src, cv::Mat& dst, int shift)
{
    const int n = src.cols * src.channels();
    for (int y = 0; y < src.rows; ++y) {
        const T* in = src.ptr<T>(y);
        uint8_t* out = dst.ptr<uint8_t>(y);
        for (int i = 0; i < n; ++i)
            out[i] = cv::saturate_cast<uint8_t>(static_cast<unsigned>(in[i]) >> shift);
    }
}

cv::Mat reduce_bit_depth(const cv::Mat& src, int shift)
{
    if (shift < 0 || shift > 15)
        throw std::invalid_argument("reduce_bit_depth: shift must be in [0, 15]");
    if (src.depth() != CV_16U && src.depth() != CV_8U)
        throw std::invalid_argument("reduce_bit_depth: expected 8- or 16-bit unsigned samples");

    cv::Mat dst(src.rows, src.cols, CV_MAKETYPE(CV_8U, src.channels()));
    if (src.depth() == CV_16U)
        shift_to_8bit<uint16_t>(src, dst, shift);
    else
        shift_to_8bit<uint8_t>(src, dst, shift);
    return dst;
}

} // namespace bayer_snapshot
