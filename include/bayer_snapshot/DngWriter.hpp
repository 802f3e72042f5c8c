#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "bayer_snapshot/ICamera.hpp"
#include "bayer_snapshot/Debayer.hpp"

namespace bayer_snapshot {

// TIFF / DNG tags written to IFD0
namespace dng_tag {
constexpr uint16_t NewSubFileType         = 254;
constexpr uint16_t ImageWidth             = 256;
constexpr uint16_t ImageLength            = 257;
constexpr uint16_t BitsPerSample          = 258;
constexpr uint16_t Compression            = 259;
constexpr uint16_t Photometric            = 262;
constexpr uint16_t Make                   = 271;
constexpr uint16_t Model                  = 272;
constexpr uint16_t StripOffsets           = 273;
constexpr uint16_t Orientation            = 274;
constexpr uint16_t SamplesPerPixel        = 277;
constexpr uint16_t RowsPerStrip           = 278;
constexpr uint16_t StripByteCounts        = 279;
constexpr uint16_t PlanarConfiguration    = 284;
constexpr uint16_t Software               = 305;
constexpr uint16_t CFARepeatPatternDim    = 33421;
constexpr uint16_t CFAPattern             = 33422;
constexpr uint16_t ExposureTime           = 33434;
constexpr uint16_t DNGVersion             = 50706;
constexpr uint16_t DNGBackwardVersion     = 50707;
constexpr uint16_t UniqueCameraModel      = 50708;
constexpr uint16_t BlackLevel             = 50714;
constexpr uint16_t WhiteLevel             = 50717;
constexpr uint16_t ColorMatrix1           = 50721;
constexpr uint16_t AsShotNeutral          = 50728;
constexpr uint16_t CalibrationIlluminant1 = 50778;
}

/// CFAPattern bytes (0 = red, 1 = green, 2 = blue) for the 2x2 block.
std::vector<uint8_t> cfa_pattern_bytes(BayerPattern pattern);

/**
 * @brief Encode a raw CFA frame as an uncompressed little-endian DNG.
 *
 * Single strip, 16 bits per sample, white level from the frame's pixel
 * depth. Throws ImageWriteError if the frame is not CV_16UC1.
 */
std::vector<uint8_t> encode_dng(const RawFrame& frame, const std::string& camera_name,
                                BayerPattern pattern);

/// encode_dng() and write the result to `path`.
void write_dng(const std::string& path, const RawFrame& frame,
               const std::string& camera_name, BayerPattern pattern);

} // namespace bayer_snapshot
