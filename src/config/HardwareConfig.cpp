#include "HardwareConfig.hpp"
#include "Config.hpp"

#include <iostream>

HardwareConfig HardwareConfig::ForVariant(CpuVariant variant) {
    HardwareConfig hw;
    hw.cpu_variant = variant;
    hw.region = (variant == CpuVariant::RP2A07) ? VideoRegion::PAL : VideoRegion::NTSC;
    return hw;
}

HardwareConfig HardwareConfig::FromConfig(const Config& config) {
    CpuVariant variant = CpuVariant::RP2A03G;
    std::string variant_text = config.Get("cpu_variant");
    if (!variant_text.empty() && !ParseCpuVariant(variant_text, variant)) {
        std::cerr << "Warning: Unknown cpu_variant '" << variant_text
                  << "', using RP2A03G\n";
    }

    HardwareConfig hw = ForVariant(variant);

    // An explicit region overrides the one implied by the CPU part
    std::string region_text = config.Get("region");
    if (!region_text.empty()) {
        VideoRegion region;
        if (ParseRegion(region_text, region)) {
            hw.region = region;
        } else {
            std::cerr << "Warning: Unknown region '" << region_text
                      << "', using " << ToString(hw.region) << "\n";
        }
    }
    return hw;
}

bool HardwareConfig::HasSampleFetchReadCorruption() const {
    switch (cpu_variant) {
        case CpuVariant::RP2A03E:
        case CpuVariant::RP2A03G:
        case CpuVariant::RP2A03H:
            return true;
        case CpuVariant::RP2A07:
            return false;
    }
    return false;
}

bool HardwareConfig::ParseCpuVariant(const std::string& text, CpuVariant& out) {
    if (text == "RP2A03E") { out = CpuVariant::RP2A03E; return true; }
    if (text == "RP2A03G") { out = CpuVariant::RP2A03G; return true; }
    if (text == "RP2A03H") { out = CpuVariant::RP2A03H; return true; }
    if (text == "RP2A07")  { out = CpuVariant::RP2A07;  return true; }
    return false;
}

bool HardwareConfig::ParseRegion(const std::string& text, VideoRegion& out) {
    if (text == "NTSC") { out = VideoRegion::NTSC; return true; }
    if (text == "PAL")  { out = VideoRegion::PAL;  return true; }
    return false;
}

const char* HardwareConfig::ToString(CpuVariant variant) {
    switch (variant) {
        case CpuVariant::RP2A03E: return "RP2A03E";
        case CpuVariant::RP2A03G: return "RP2A03G";
        case CpuVariant::RP2A03H: return "RP2A03H";
        case CpuVariant::RP2A07:  return "RP2A07";
    }
    return "RP2A03G";
}

const char* HardwareConfig::ToString(VideoRegion region) {
    return region == VideoRegion::PAL ? "PAL" : "NTSC";
}
