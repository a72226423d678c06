#pragma once

#include <cstdint>
#include <string>
#include <vector>

class Emulator;

/**
 * Snapshot - Whole-machine save states
 *
 * Layout (little-endian):
 * - "NDMA" magic
 * - u32 format version
 * - u8 CPU variant, u8 video region
 * - u32 payload size
 * - payload: every component in a fixed order
 *
 * Restore rejects a snapshot taken on different hardware, then loads the
 * payload into a scratch emulator and checks every component's ranges before
 * touching the target, so a rejected snapshot leaves it unchanged.
 * Connected callbacks are not part of a snapshot.
 */
class Snapshot {
public:
    static constexpr uint32_t FORMAT_VERSION = 2;
    static constexpr size_t HEADER_SIZE = 14;

    static std::vector<uint8_t> Capture(const Emulator& emu);
    static bool Restore(Emulator& emu, const std::vector<uint8_t>& data);

    static bool SaveToFile(const Emulator& emu, const std::string& path);
    static bool LoadFromFile(Emulator& emu, const std::string& path);
};
