#include "SyntheticBoard.hpp"
#include "board_log.hpp"

#include <chrono>
#include <cmath>
#include <vector>

namespace {

const double kPi = 3.14159265358979323846;

} // namespace

SyntheticBoard::SyntheticBoard(const std::string& portName)
    : Board(static_cast<int>(BoardIds::SYNTHETIC_BOARD), portName)
    , _generator(std::random_device{}()) {
}

SyntheticBoard::~SyntheticBoard() {
    try {
        ReleaseSession();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to release synthetic session: " << e.what());
    }
}

void SyntheticBoard::OpenDevice() {
    LOG_DEBUG("Synthetic board has no device to open");
}

void SyntheticBoard::StartDevice() {
}

void SyntheticBoard::StopDevice() {
}

void SyntheticBoard::CloseDevice() {
}

void SyntheticBoard::ReadData() {
    const unsigned int samplingRate = _descriptor.samplingRate;
    const unsigned int numEeg = _descriptor.numEegChannels;
    const unsigned int numAccel = _descriptor.packageLength - 1 - numEeg;

    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<float> package(_descriptor.packageLength);

    const auto period = std::chrono::microseconds(1000000 / samplingRate);
    auto nextSample = std::chrono::steady_clock::now();
    unsigned long long sampleIndex = 0;

    while (_keep_alive) {
        double t = static_cast<double>(sampleIndex) / samplingRate;

        package[0] = static_cast<float>(sampleIndex % 256);
        for (unsigned int i = 0; i < numEeg; ++i) {
            double value = DC_OFFSET_UV +
                           ChannelAmplitude(i) * std::sin(2.0 * kPi * ChannelFrequency(i) * t) +
                           noise(_generator);
            package[1 + i] = static_cast<float>(value);
        }
        for (unsigned int i = 0; i < numAccel; ++i) {
            package[1 + numEeg + i] = static_cast<float>(std::sin(2.0 * kPi * 0.5 * t + i));
        }

        PushPackage(package.data());
        ++sampleIndex;

        nextSample += period;
        std::this_thread::sleep_until(nextSample);
    }
}
