#include "DmcChannel.hpp"
#include "state/StateStream.hpp"

DmcChannel::DmcChannel() {
    Reset();
}

void DmcChannel::Reset(VideoRegion region) {
    rate_table = (region == VideoRegion::PAL) ? &PAL_RATES : &NTSC_RATES;

    irq_enabled = false;
    loop = false;
    rate_index = 0;
    sample_address_reg = 0;
    sample_length_reg = 0;

    timer_period = (*rate_table)[0];
    timer_counter = timer_period;

    output_level = 0;
    shift_register = 0;
    bits_remaining = 8;
    silence = true;

    sample_buffer = 0;
    sample_buffer_empty = true;
    current_address = SampleAddress(0);
    bytes_remaining = 0;
    fetch_pending = false;

    irq_flag = false;
}

void DmcChannel::Step() {
    if (timer_counter > 0) {
        timer_counter--;
    }
    if (timer_counter == 0) {
        timer_counter = timer_period;
        ClockOutputUnit();
    }
}

void DmcChannel::ClockOutputUnit() {
    if (!silence) {
        if (shift_register & 0x01) {
            if (output_level <= 125) output_level += 2;
        } else {
            if (output_level >= 2) output_level -= 2;
        }
        shift_register >>= 1;
    }

    bits_remaining--;
    if (bits_remaining == 0) {
        bits_remaining = 8;
        if (sample_buffer_empty) {
            silence = true;
        } else {
            silence = false;
            shift_register = sample_buffer;
            sample_buffer_empty = true;
        }
    }
}

void DmcChannel::WriteRegister(uint16_t addr, uint8_t value) {
    switch (addr) {
        case 0x4010:
            irq_enabled = (value & 0x80) != 0;
            loop = (value & 0x40) != 0;
            rate_index = value & 0x0F;
            timer_period = (*rate_table)[rate_index];
            if (!irq_enabled) irq_flag = false;
            break;

        case 0x4011:
            output_level = value & 0x7F;
            break;

        case 0x4012:
            sample_address_reg = value;
            break;

        case 0x4013:
            sample_length_reg = value;
            break;

        case 0x4015:
            irq_flag = false;
            if (value & 0x10) {
                if (bytes_remaining == 0) RestartSample();
            } else {
                bytes_remaining = 0;
            }
            break;

        default:
            break;
    }
}

uint8_t DmcChannel::ReadStatus() const {
    uint8_t value = 0;
    if (bytes_remaining > 0) value |= 0x10;
    if (irq_flag) value |= 0x80;
    return value;
}

void DmcChannel::LoadSampleByte(uint8_t value) {
    fetch_pending = false;
    sample_buffer = value;
    sample_buffer_empty = false;

    current_address = (current_address == 0xFFFF) ? 0x8000 : current_address + 1;

    // Channel may have been disabled while the fetch was in flight
    if (bytes_remaining == 0) return;

    bytes_remaining--;
    if (bytes_remaining == 0) {
        if (loop) {
            RestartSample();
        } else if (irq_enabled) {
            irq_flag = true;
        }
    }
}

void DmcChannel::RestartSample() {
    current_address = SampleAddress(sample_address_reg);
    bytes_remaining = SampleLength(sample_length_reg);
}

void DmcChannel::SaveState(StateWriter& out) const {
    out.Bool(irq_enabled);
    out.Bool(loop);
    out.U8(rate_index);
    out.U8(sample_address_reg);
    out.U8(sample_length_reg);
    out.U16(timer_period);
    out.U16(timer_counter);
    out.U8(output_level);
    out.U8(shift_register);
    out.U8(bits_remaining);
    out.Bool(silence);
    out.U8(sample_buffer);
    out.Bool(sample_buffer_empty);
    out.U16(current_address);
    out.U16(bytes_remaining);
    out.Bool(fetch_pending);
    out.Bool(irq_flag);
}

void DmcChannel::LoadState(StateReader& in) {
    irq_enabled = in.Bool();
    loop = in.Bool();
    rate_index = in.U8() & 0x0F;
    sample_address_reg = in.U8();
    sample_length_reg = in.U8();
    timer_period = in.U16();
    timer_counter = in.U16();
    output_level = in.U8();
    shift_register = in.U8();
    bits_remaining = in.U8();
    silence = in.Bool();
    sample_buffer = in.U8();
    sample_buffer_empty = in.Bool();
    current_address = in.U16();
    bytes_remaining = in.U16();
    fetch_pending = in.Bool();
    irq_flag = in.Bool();
}
