#pragma once

#include <string>

#include "BoardDescriptor.hpp"
#include "BoardException.hpp"

// Holds a recording of one board and applies conditioning to its EEG rows.
// The matrix layout is the one returned by BoardShim::GetBoardData().
class DataHandler {
public:
    static const unsigned int DEFAULT_FILTER_ORDER = 4;

    DataHandler(int board_id, const SampleMatrix& data_from_board);
    DataHandler(int board_id, const std::string& csv_file);

    // Returns false if the file could not be written
    bool SaveCsv(const std::string& filename) const;

    void RemoveDcOffset();

    // Zero-phase Butterworth band-pass, requires 0 < low < high < fs / 2
    void Bandpass(double low_hz, double high_hz, unsigned int order = DEFAULT_FILTER_ORDER);

    const SampleMatrix& GetData() const { return _data; }
    size_t GetNumSamples() const { return _data.empty() ? 0 : _data[0].size(); }
    unsigned int GetSamplingRate() const { return _descriptor.samplingRate; }
    int GetBoardId() const { return _board_id; }

private:
    void ValidateShape() const;

    int _board_id;
    const BoardDescriptor& _descriptor;
    SampleMatrix _data;
};
