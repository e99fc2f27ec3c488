#pragma once

#include "Board.hpp"

#include <random>

// Simulated device producing sines with a DC offset on every EEG channel
class SyntheticBoard : public Board {
public:
    static const int DC_OFFSET_UV = 100;

    explicit SyntheticBoard(const std::string& portName = "");
    ~SyntheticBoard() override;

    // Frequency and amplitude generated on EEG channel channelIndex (0-based)
    static double ChannelFrequency(unsigned int channelIndex) { return 5.0 * (channelIndex + 1); }
    static double ChannelAmplitude(unsigned int channelIndex) { return 10.0 * (channelIndex + 1); }

protected:
    void OpenDevice() override;
    void StartDevice() override;
    void StopDevice() override;
    void CloseDevice() override;
    void ReadData() override;

private:
    std::mt19937 _generator;
};
