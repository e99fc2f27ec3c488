#pragma once

#include <vector>

struct BiquadSection {
    double b0;
    double b1;
    double b2;
    double a1;
    double a2;
};

// Even order Butterworth low-pass or high-pass built as a cascade of
// second order sections (bilinear transform).
class ButterworthFilter {
public:
    enum class Type {
        LowPass,
        HighPass
    };

    static const unsigned int MIN_ORDER = 2;
    static const unsigned int MAX_ORDER = 8;

    // Throws BoardException(INVALID_ARGUMENTS_ERROR) unless the order is even
    // and within [MIN_ORDER, MAX_ORDER] and 0 < cutoffHz < samplingRate / 2
    ButterworthFilter(Type type, unsigned int order, double cutoffHz, double samplingRate);

    // Causal filtering, starting from a zero state
    void Process(std::vector<double>& samples) const;

    // Forward then backward pass, zero phase and squared magnitude response.
    // Edges are padded with an odd reflection of the signal.
    void FiltFilt(std::vector<double>& samples) const;

    double MagnitudeAt(double frequencyHz) const;

    const std::vector<BiquadSection>& GetSections() const { return _sections; }
    Type GetType() const { return _type; }
    unsigned int GetOrder() const { return _order; }

private:
    Type _type;
    unsigned int _order;
    double _cutoff_hz;
    double _sampling_rate;
    std::vector<BiquadSection> _sections;
};
