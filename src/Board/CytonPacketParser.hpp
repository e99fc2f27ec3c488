#pragma once

#include <cstddef>
#include <cstdint>

// Decodes OpenBCI Cyton 33-byte packets:
//   [0]      0xA0 start byte
//   [1]      package number
//   [2..25]  8 EEG values, signed 24-bit big-endian
//   [26..31] 3 aux values, signed 16-bit big-endian
//   [32]     0xC0..0xCF stop byte, aux carries accelerometer data only for 0xC0
class CytonPacketParser {
public:
    static const size_t PACKET_SIZE = 33;
    static const unsigned char START_BYTE = 0xA0;
    static const unsigned int NUM_EEG_CHANNELS = 8;
    static const unsigned int NUM_ACCEL_CHANNELS = 3;
    // package number + EEG + accel
    static const unsigned int PACKAGE_LENGTH = 1 + NUM_EEG_CHANNELS + NUM_ACCEL_CHANNELS;

    static const double EEG_SCALE;
    static const double ACCEL_SCALE;

    CytonPacketParser();

    // packet points at PACKET_SIZE bytes starting with START_BYTE.
    // Fills PACKAGE_LENGTH values, returns false if the stop byte is invalid.
    bool Parse(const unsigned char* packet, float* package);

    static int32_t Cast24BitToInt32(const unsigned char* bytes);
    static int16_t Cast16BitToInt16(const unsigned char* bytes);

private:
    float _last_accel[NUM_ACCEL_CHANNELS];
};
