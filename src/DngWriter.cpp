#include "bayer_snapshot/DngWriter.hpp"
#include "bayer_snapshot/CameraError.hpp"
#include <rclcpp/rclcpp.hpp>
#include <algorithm>
#include <fstream>
#include <utility>

namespace bayer_snapshot {

namespace {

enum FieldType : uint16_t {
    BYTE = 1, ASCII = 2, SHORT = 3, LONG = 4, RATIONAL = 5, SRATIONAL = 10
};

struct Entry {
    uint16_t tag;
    uint16_t type;
    uint32_t count;
    std::vector<uint8_t> bytes;  // value, little-endian
};

void put16(std::vector<uint8_t>& b, uint16_t v)
{
    b.push_back(static_cast<uint8_t>(v & 0xff));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& b, uint32_t v)
{
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void patch32(std::vector<uint8_t>& b, size_t at, uint32_t v)
{
    for (int i = 0; i < 4; ++i) b[at + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xff);
}

class IfdBuilder {
public:
    void bytes(uint16_t tag, const std::vector<uint8_t>& v)
    {
        entries_.push_back({tag, BYTE, static_cast<uint32_t>(v.size()), v});
    }
    void ascii(uint16_t tag, const std::string& s)
    {
        std::vector<uint8_t> b(s.begin(), s.end());
        b.push_back(0);
        entries_.push_back({tag, ASCII, static_cast<uint32_t>(b.size()), b});
    }
    void shorts(uint16_t tag, const std::vector<uint16_t>& v)
    {
        std::vector<uint8_t> b;
        for (auto x : v) put16(b, x);
        entries_.push_back({tag, SHORT, static_cast<uint32_t>(v.size()), b});
    }
    void longs(uint16_t tag, const std::vector<uint32_t>& v)
    {
        std::vector<uint8_t> b;
        for (auto x : v) put32(b, x);
        entries_.push_back({tag, LONG, static_cast<uint32_t>(v.size()), b});
    }
    void rationals(uint16_t tag, const std::vector<std::pair<uint32_t, uint32_t>>& v)
    {
        std::vector<uint8_t> b;
        for (auto& r : v) { put32(b, r.first); put32(b, r.second); }
        entries_.push_back({tag, RATIONAL, static_cast<uint32_t>(v.size()), b});
    }
    void srationals(uint16_t tag, const std::vector<std::pair<int32_t, int32_t>>& v)
    {
        std::vector<uint8_t> b;
        for (auto& r : v) {
            put32(b, static_cast<uint32_t>(r.first));
            put32(b, static_cast<uint32_t>(r.second));
        }
        entries_.push_back({tag, SRATIONAL, static_cast<uint32_t>(v.size()), b});
    }

    /**
     * Lay out header, IFD0, out-of-line values, then the pixel strip.
     * StripOffsets is patched once the strip position is known.
     */
    std::vector<uint8_t> finish(const std::vector<uint8_t>& strip)
    {
        std::sort(entries_.begin(), entries_.end(),
                  [](const Entry& a, const Entry& b) { return a.tag < b.tag; });

        const uint32_t ifd_offset = 8;
        const uint32_t ifd_size = 2 + 12 * static_cast<uint32_t>(entries_.size()) + 4;
        uint32_t data_offset = ifd_offset + ifd_size;

        std::vector<uint8_t> out;
        out.reserve(data_offset + strip.size() + 1024);
        out.push_back('I'); out.push_back('I');
        put16(out, 42);
        put32(out, ifd_offset);

        std::vector<uint8_t> extra;
        size_t strip_offset_field = 0;

        put16(out, static_cast<uint16_t>(entries_.size()));
        for (const auto& e : entries_) {
            put16(out, e.tag);
            put16(out, e.type);
            put32(out, e.count);
            if (e.bytes.size() <= 4) {
                if (e.tag == dng_tag::StripOffsets) strip_offset_field = out.size();
                std::vector<uint8_t> inl(e.bytes);
                inl.resize(4, 0);
                out.insert(out.end(), inl.begin(), inl.end());
            } else {
                put32(out, data_offset + static_cast<uint32_t>(extra.size()));
                extra.insert(extra.end(), e.bytes.begin(), e.bytes.end());
                if (extra.size() % 2) extra.push_back(0);  // word alignment
            }
        }
        put32(out, 0);  // no next IFD

        out.insert(out.end(), extra.begin(), extra.end());
        patch32(out, strip_offset_field, static_cast<uint32_t>(out.size()));
        out.insert(out.end(), strip.begin(), strip.end());
        return out;
    }

private:
    std::vector<Entry> entries_;
};

} // namespace

std::vector<uint8_t> cfa_pattern_bytes(BayerPattern pattern)
{
    switch (pattern) {
    case BayerPattern::RGGB: return {0, 1, 1, 2};
    case BayerPattern::GRBG: return {1, 0, 2, 1};
    case BayerPattern::GBRG: return {1, 2, 0, 1};
    case BayerPattern::BGGR: return {2, 1, 1, 0};
    }
    return {};
}

std::vector<uint8_t> encode_dng(const RawFrame& frame, const std::string& camera_name,
                                BayerPattern pattern)
{
    if (frame.empty() || frame.data.type() != CV_16UC1)
        throw ImageWriteError("DNG output needs a single channel 16-bit frame");

    const uint32_t w = static_cast<uint32_t>(frame.width());
    const uint32_t h = static_cast<uint32_t>(frame.height());
    const int depth = (frame.meta.pixel_depth > 0 && frame.meta.pixel_depth <= 16)
                          ? frame.meta.pixel_depth : 16;
    const std::string model = camera_name.empty() ? "Unknown camera" : camera_name;

    std::vector<uint8_t> strip;
    strip.reserve(static_cast<size_t>(w) * h * 2);
    for (int y = 0; y < frame.height(); ++y) {
        const uint16_t* row = frame.data.ptr<uint16_t>(y);
        for (uint32_t x = 0; x < w; ++x) put16(strip, row[x]);
    }

    IfdBuilder ifd;
    ifd.longs(dng_tag::NewSubFileType, {0});
    ifd.longs(dng_tag::ImageWidth, {w});
    ifd.longs(dng_tag::ImageLength, {h});
    ifd.shorts(dng_tag::BitsPerSample, {16});
    ifd.shorts(dng_tag::Compression, {1});
    ifd.shorts(dng_tag::Photometric, {32803});  // CFA
    ifd.ascii(dng_tag::Make, model.substr(0, model.find(' ')));
    ifd.ascii(dng_tag::Model, model);
    ifd.longs(dng_tag::StripOffsets, {0});
    ifd.shorts(dng_tag::Orientation, {1});
    ifd.shorts(dng_tag::SamplesPerPixel, {1});
    ifd.longs(dng_tag::RowsPerStrip, {h});
    ifd.longs(dng_tag::StripByteCounts, {static_cast<uint32_t>(strip.size())});
    ifd.shorts(dng_tag::PlanarConfiguration, {1});
    ifd.ascii(dng_tag::Software, "bayer_snapshot");
    ifd.shorts(dng_tag::CFARepeatPatternDim, {2, 2});
    ifd.bytes(dng_tag::CFAPattern, cfa_pattern_bytes(pattern));
    // EXIF tag kept in IFD0 (TIFF/EP style); DNG readers accept it there
    if (frame.meta.exposure_us > 0)
        ifd.rationals(dng_tag::ExposureTime, {{frame.meta.exposure_us, 1000000}});
    ifd.bytes(dng_tag::DNGVersion, {1, 4, 0, 0});
    ifd.bytes(dng_tag::DNGBackwardVersion, {1, 1, 0, 0});
    ifd.ascii(dng_tag::UniqueCameraModel, model);
    ifd.longs(dng_tag::BlackLevel, {0});
    ifd.longs(dng_tag::WhiteLevel, {(1u << depth) - 1u});
    ifd.srationals(dng_tag::ColorMatrix1, {{1, 1}, {0, 1}, {0, 1},
                                           {0, 1}, {1, 1}, {0, 1},
                                           {0, 1}, {0, 1}, {1, 1}});
    ifd.rationals(dng_tag::AsShotNeutral, {{1, 1}, {1, 1}, {1, 1}});
    ifd.shorts(dng_tag::CalibrationIlluminant1, {21});  // D65

    return ifd.finish(strip);
}

void write_dng(const std::string& path, const RawFrame& frame,
               const std::string& camera_name, BayerPattern pattern)
{
    std::vector<uint8_t> bytes = encode_dng(frame, camera_name, pattern);

    std::ofstream f(path, std::ios::binary);
    if (!f)
        throw ImageWriteError("cannot open " + path + " for writing");
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f)
        throw ImageWriteError("write failed for " + path);

    RCLCPP_INFO(rclcpp::get_logger("DngWriter"), "Saved %s (%dx%d %s, %zu bytes)",
                path.c_str(), frame.width(), frame.height(),
                to_string(pattern).c_str(), bytes.size());
}

} // namespace bayer_snapshot
