#pragma once

#include <cstdint>
#include <string>

class Config;

// CPU revisions. The three NTSC parts share the sample-fetch re-read bug,
// the PAL part does not.
enum class CpuVariant : uint8_t {
    RP2A03E,
    RP2A03G,
    RP2A03H,
    RP2A07
};

enum class VideoRegion : uint8_t {
    NTSC,
    PAL
};

/**
 * HardwareConfig - Typed view of the console being emulated
 *
 * Built from the INI Config ("cpu_variant", "region") or directly by tests.
 * Unknown strings fall back to the standard NTSC front-loader (RP2A03G).
 */
struct HardwareConfig {
    CpuVariant cpu_variant = CpuVariant::RP2A03G;
    VideoRegion region = VideoRegion::NTSC;

    static HardwareConfig FromConfig(const Config& config);
    static HardwareConfig ForVariant(CpuVariant variant);

    // NTSC 2A03 revisions repeat the halted CPU read during DMC DMA
    bool HasSampleFetchReadCorruption() const;

    static bool ParseCpuVariant(const std::string& text, CpuVariant& out);
    static bool ParseRegion(const std::string& text, VideoRegion& out);
    static const char* ToString(CpuVariant variant);
    static const char* ToString(VideoRegion region);
};
