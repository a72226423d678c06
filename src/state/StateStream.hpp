#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * StateWriter / StateReader - Little-endian field streams for snapshots
 *
 * Components serialize themselves field by field in a fixed order.
 * The reader never throws: running past the end sets a sticky failure flag
 * and returns zeros, so callers check Ok() once at the end.
 */
class StateWriter {
public:
    explicit StateWriter(std::vector<uint8_t>& out) : out(out) {}

    void U8(uint8_t value) { out.push_back(value); }
    void Bool(bool value) { out.push_back(value ? 1 : 0); }

    void U16(uint16_t value) {
        U8(static_cast<uint8_t>(value));
        U8(static_cast<uint8_t>(value >> 8));
    }

    void U32(uint32_t value) {
        U16(static_cast<uint16_t>(value));
        U16(static_cast<uint16_t>(value >> 16));
    }

    void U64(uint64_t value) {
        U32(static_cast<uint32_t>(value));
        U32(static_cast<uint32_t>(value >> 32));
    }

    void Bytes(const uint8_t* data, size_t size) {
        out.insert(out.end(), data, data + size);
    }

private:
    std::vector<uint8_t>& out;
};

class StateReader {
public:
    StateReader(const std::vector<uint8_t>& in, size_t offset = 0) : in(in), pos(offset) {}

    uint8_t U8() {
        if (pos >= in.size()) {
            ok = false;
            return 0;
        }
        return in[pos++];
    }

    bool Bool() { return U8() != 0; }

    uint16_t U16() {
        uint16_t lo = U8();
        uint16_t hi = U8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }

    uint32_t U32() {
        uint32_t lo = U16();
        uint32_t hi = U16();
        return lo | (hi << 16);
    }

    uint64_t U64() {
        uint64_t lo = U32();
        uint64_t hi = U32();
        return lo | (hi << 32);
    }

    void Bytes(uint8_t* data, size_t size) {
        for (size_t i = 0; i < size; i++) {
            data[i] = U8();
        }
    }

    // Components call this when a field is out of range
    void Fail() { ok = false; }

    bool Ok() const { return ok; }
    size_t Position() const { return pos; }

private:
    const std::vector<uint8_t>& in;
    size_t pos;
    bool ok = true;
};
