#include "DataHandler.hpp"
#include "Filters/ButterworthFilter.hpp"
#include "SavingWorkers/CsvWorker.hpp"
#include "board_log.hpp"

#include <numeric>

DataHandler::DataHandler(int board_id, const SampleMatrix& data_from_board)
    : _board_id(board_id)
    , _descriptor(GetBoardDescriptor(board_id))
    , _data(data_from_board) {
    ValidateShape();
}

DataHandler::DataHandler(int board_id, const std::string& csv_file)
    : _board_id(board_id)
    , _descriptor(GetBoardDescriptor(board_id)) {
    std::vector<std::string> columnNames;
    _data = CsvWorker::Load(csv_file, &columnNames);
    if (columnNames != GetColumnNames(board_id)) {
        throw BoardException(csv_file + " columns do not match board " + _descriptor.name,
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    ValidateShape();
}

bool DataHandler::SaveCsv(const std::string& filename) const {
    CsvWorker worker(filename);
    worker.SetColumnNames(GetColumnNames(_board_id));
    worker.SetData(_data);
    return worker.Save();
}

void DataHandler::RemoveDcOffset() {
    const unsigned int first = _descriptor.FirstEegRow();
    for (unsigned int row = first; row < first + _descriptor.numEegChannels; ++row) {
        std::vector<double>& channel = _data[row];
        if (channel.empty()) {
            continue;
        }
        double mean = std::accumulate(channel.begin(), channel.end(), 0.0) / channel.size();
        for (double& value : channel) {
            value -= mean;
        }
    }
    LOG_DEBUG("Removed DC offset from " << _descriptor.numEegChannels << " channels");
}

void DataHandler::Bandpass(double low_hz, double high_hz, unsigned int order) {
    if (!(low_hz < high_hz)) {
        throw BoardException("low cutoff must be below high cutoff",
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    const double samplingRate = _descriptor.samplingRate;
    ButterworthFilter highPass(ButterworthFilter::Type::HighPass, order, low_hz, samplingRate);
    ButterworthFilter lowPass(ButterworthFilter::Type::LowPass, order, high_hz, samplingRate);

    const unsigned int first = _descriptor.FirstEegRow();
    for (unsigned int row = first; row < first + _descriptor.numEegChannels; ++row) {
        highPass.FiltFilt(_data[row]);
        lowPass.FiltFilt(_data[row]);
    }
    LOG_DEBUG("Applied " << low_hz << "-" << high_hz << " Hz band-pass of order " << order);
}

void DataHandler::ValidateShape() const {
    if (_data.size() != _descriptor.NumRows()) {
        throw BoardException("expected " + std::to_string(_descriptor.NumRows()) + " rows, got " +
                                 std::to_string(_data.size()),
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    for (const std::vector<double>& row : _data) {
        if (row.size() != _data[0].size()) {
            throw BoardException("rows of the sample matrix differ in length",
                                 StreamExitCodes::INVALID_ARGUMENTS_ERROR);
        }
    }
}
