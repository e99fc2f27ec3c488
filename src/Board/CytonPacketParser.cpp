#include "CytonPacketParser.hpp"

const double CytonPacketParser::EEG_SCALE = 4.5 / 24.0 / 8388607.0 * 1000000.0;
const double CytonPacketParser::ACCEL_SCALE = 0.002 / 16.0;

CytonPacketParser::CytonPacketParser()
    : _last_accel{0.0f, 0.0f, 0.0f} {
}

bool CytonPacketParser::Parse(const unsigned char* packet, float* package) {
    if (packet[0] != START_BYTE) {
        return false;
    }
    unsigned char stopByte = packet[PACKET_SIZE - 1];
    if (stopByte < 0xC0 || stopByte > 0xCF) {
        return false;
    }

    package[0] = static_cast<float>(packet[1]);
    for (unsigned int i = 0; i < NUM_EEG_CHANNELS; ++i) {
        package[1 + i] = static_cast<float>(EEG_SCALE * Cast24BitToInt32(packet + 2 + 3 * i));
    }

    if (stopByte == 0xC0) {
        for (unsigned int i = 0; i < NUM_ACCEL_CHANNELS; ++i) {
            _last_accel[i] = static_cast<float>(ACCEL_SCALE * Cast16BitToInt16(packet + 26 + 2 * i));
        }
    }
    for (unsigned int i = 0; i < NUM_ACCEL_CHANNELS; ++i) {
        package[1 + NUM_EEG_CHANNELS + i] = _last_accel[i];
    }
    return true;
}

int32_t CytonPacketParser::Cast24BitToInt32(const unsigned char* bytes) {
    uint32_t value = (static_cast<uint32_t>(bytes[0]) << 16) |
                     (static_cast<uint32_t>(bytes[1]) << 8) |
                     static_cast<uint32_t>(bytes[2]);
    if (value & 0x00800000u) {
        value |= 0xFF000000u;
    }
    return static_cast<int32_t>(value);
}

int16_t CytonPacketParser::Cast16BitToInt16(const unsigned char* bytes) {
    return static_cast<int16_t>((static_cast<uint16_t>(bytes[0]) << 8) | bytes[1]);
}
