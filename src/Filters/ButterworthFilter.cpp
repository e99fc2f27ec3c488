#include "ButterworthFilter.hpp"
#include "BoardException.hpp"

#include <algorithm>
#include <cmath>
#include <complex>

namespace {

const double kPi = 3.14159265358979323846;

} // namespace

ButterworthFilter::ButterworthFilter(Type type, unsigned int order, double cutoffHz, double samplingRate)
    : _type(type)
    , _order(order)
    , _cutoff_hz(cutoffHz)
    , _sampling_rate(samplingRate) {
    if (order < MIN_ORDER || order > MAX_ORDER || order % 2 != 0) {
        throw BoardException("filter order must be even and between 2 and 8, got " + std::to_string(order),
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    if (!(samplingRate > 0.0) || !(cutoffHz > 0.0) || !(cutoffHz < samplingRate / 2.0)) {
        throw BoardException("cutoff " + std::to_string(cutoffHz) + " Hz is outside (0, " +
                                 std::to_string(samplingRate / 2.0) + ") Hz",
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }

    const double w0 = 2.0 * kPi * cutoffHz / samplingRate;
    const double cosW0 = std::cos(w0);
    const double sinW0 = std::sin(w0);

    const unsigned int numSections = order / 2;
    for (unsigned int k = 0; k < numSections; ++k) {
        // Pole pair k of the analog Butterworth prototype
        const double q = 1.0 / (2.0 * std::sin(kPi * (2.0 * k + 1.0) / (2.0 * order)));
        const double alpha = sinW0 / (2.0 * q);
        const double a0 = 1.0 + alpha;

        BiquadSection section;
        if (type == Type::LowPass) {
            section.b0 = (1.0 - cosW0) / 2.0 / a0;
            section.b1 = (1.0 - cosW0) / a0;
            section.b2 = section.b0;
        } else {
            section.b0 = (1.0 + cosW0) / 2.0 / a0;
            section.b1 = -(1.0 + cosW0) / a0;
            section.b2 = section.b0;
        }
        section.a1 = -2.0 * cosW0 / a0;
        section.a2 = (1.0 - alpha) / a0;
        _sections.push_back(section);
    }
}

void ButterworthFilter::Process(std::vector<double>& samples) const {
    for (const BiquadSection& s : _sections) {
        double z1 = 0.0;
        double z2 = 0.0;
        for (double& x : samples) {
            double y = s.b0 * x + z1;
            z1 = s.b1 * x - s.a1 * y + z2;
            z2 = s.b2 * x - s.a2 * y;
            x = y;
        }
    }
}

void ButterworthFilter::FiltFilt(std::vector<double>& samples) const {
    const size_t n = samples.size();
    if (n < 2) {
        return;
    }
    const size_t pad = std::min(n - 1, static_cast<size_t>(_sampling_rate));

    std::vector<double> extended;
    extended.reserve(n + 2 * pad);
    for (size_t i = pad; i > 0; --i) {
        extended.push_back(2.0 * samples[0] - samples[i]);
    }
    extended.insert(extended.end(), samples.begin(), samples.end());
    for (size_t i = 1; i <= pad; ++i) {
        extended.push_back(2.0 * samples[n - 1] - samples[n - 1 - i]);
    }

    Process(extended);
    std::reverse(extended.begin(), extended.end());
    Process(extended);
    std::reverse(extended.begin(), extended.end());

    std::copy(extended.begin() + pad, extended.begin() + pad + n, samples.begin());
}

double ButterworthFilter::MagnitudeAt(double frequencyHz) const {
    const double w = 2.0 * kPi * frequencyHz / _sampling_rate;
    const std::complex<double> z1 = std::polar(1.0, -w);
    const std::complex<double> z2 = z1 * z1;

    std::complex<double> response(1.0, 0.0);
    for (const BiquadSection& s : _sections) {
        response *= (s.b0 + s.b1 * z1 + s.b2 * z2) / (1.0 + s.a1 * z1 + s.a2 * z2);
    }
    return std::abs(response);
}
