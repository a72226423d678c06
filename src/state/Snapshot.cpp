#include "Snapshot.hpp"
#include "StateStream.hpp"
#include "Emulator.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

static constexpr uint8_t MAGIC[4] = { 'N', 'D', 'M', 'A' };

static size_t PayloadSize(const Emulator& emu) {
    std::vector<uint8_t> payload;
    StateWriter writer(payload);
    emu.SaveState(writer);
    return payload.size();
}

std::vector<uint8_t> Snapshot::Capture(const Emulator& emu) {
    std::vector<uint8_t> payload;
    StateWriter payload_writer(payload);
    emu.SaveState(payload_writer);

    std::vector<uint8_t> data;
    data.reserve(HEADER_SIZE + payload.size());
    StateWriter writer(data);
    writer.Bytes(MAGIC, sizeof(MAGIC));
    writer.U32(FORMAT_VERSION);
    writer.U8(static_cast<uint8_t>(emu.GetHardwareConfig().cpu_variant));
    writer.U8(static_cast<uint8_t>(emu.GetHardwareConfig().region));
    writer.U32(static_cast<uint32_t>(payload.size()));
    writer.Bytes(payload.data(), payload.size());
    return data;
}

bool Snapshot::Restore(Emulator& emu, const std::vector<uint8_t>& data) {
    if (data.size() < HEADER_SIZE) {
        std::cerr << "Error: Snapshot too small (" << data.size() << " bytes)\n";
        return false;
    }

    StateReader header(data);
    uint8_t magic[4];
    header.Bytes(magic, sizeof(magic));
    if (magic[0] != MAGIC[0] || magic[1] != MAGIC[1] ||
        magic[2] != MAGIC[2] || magic[3] != MAGIC[3]) {
        std::cerr << "Error: Not a snapshot (bad magic)\n";
        return false;
    }

    uint32_t version = header.U32();
    if (version != FORMAT_VERSION) {
        std::cerr << "Error: Unsupported snapshot version " << version << "\n";
        return false;
    }

    const HardwareConfig& hardware = emu.GetHardwareConfig();
    uint8_t variant = header.U8();
    uint8_t region = header.U8();
    if (variant != static_cast<uint8_t>(hardware.cpu_variant) ||
        region != static_cast<uint8_t>(hardware.region)) {
        std::cerr << "Error: Snapshot hardware mismatch (snapshot variant " << static_cast<int>(variant)
                  << " region " << static_cast<int>(region) << ", emulator is "
                  << HardwareConfig::ToString(hardware.cpu_variant) << " "
                  << HardwareConfig::ToString(hardware.region) << ")\n";
        return false;
    }

    uint32_t payload_size = header.U32();
    size_t expected = PayloadSize(emu);
    if (payload_size != expected || data.size() != HEADER_SIZE + expected) {
        std::cerr << "Error: Snapshot size mismatch (expected " << expected
                  << " payload bytes, got " << payload_size << ")\n";
        return false;
    }

    Emulator scratch(hardware);
    StateReader check(data, HEADER_SIZE);
    scratch.LoadState(check);
    if (!check.Ok()) {
        std::cerr << "Error: Snapshot payload is corrupt\n";
        return false;
    }

    StateReader reader(data, HEADER_SIZE);
    emu.LoadState(reader);
    return reader.Ok();
}

bool Snapshot::SaveToFile(const Emulator& emu, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open snapshot file for writing: " << path << "\n";
        return false;
    }

    std::vector<uint8_t> data = Capture(emu);
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file) {
        std::cerr << "Error: Failed to write snapshot: " << path << "\n";
        return false;
    }
    return true;
}

bool Snapshot::LoadFromFile(Emulator& emu, const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open snapshot file: " << path << "\n";
        return false;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    return Restore(emu, data);
}
