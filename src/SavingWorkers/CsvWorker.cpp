#include "CsvWorker.hpp"
#include "BoardException.hpp"
#include "board_log.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<std::string> SplitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream stream(line);
    std::string cell;
    while (std::getline(stream, cell, ',')) {
        if (!cell.empty() && cell.back() == '\r') {
            cell.pop_back();
        }
        cells.push_back(cell);
    }
    return cells;
}

} // namespace

CsvWorker::CsvWorker(const std::string& filename)
    : _filename(filename) {
}

bool CsvWorker::Save() {
    if (!_data_set) {
        throw SavingWorkerException("Data must be specified before saving " + _filename);
    }
    if (!_names_set || _column_names.size() != _data.size()) {
        throw SavingWorkerException("Column names must match data rows for " + _filename);
    }

    std::ofstream file(_filename);
    if (!file.is_open()) {
        LOG_ERROR("Could not open output file: " << _filename);
        return false;
    }

    for (size_t row = 0; row < _column_names.size(); ++row) {
        file << (row ? "," : "") << _column_names[row];
    }
    file << "\n";

    const size_t numSamples = _data.empty() ? 0 : _data[0].size();
    file << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t sample = 0; sample < numSamples; ++sample) {
        for (size_t row = 0; row < _data.size(); ++row) {
            file << (row ? "," : "") << _data[row][sample];
        }
        file << "\n";
    }

    file.flush();
    if (!file) {
        LOG_ERROR("Failed writing " << _filename);
        return false;
    }
    LOG_INFO("Saved " << numSamples << " samples to " << _filename);
    return true;
}

SampleMatrix CsvWorker::Load(const std::string& filename, std::vector<std::string>* columnNames) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw BoardException("unable to open " + filename, StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw BoardException(filename + " has no header line", StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    std::vector<std::string> header = SplitLine(line);
    SampleMatrix matrix(header.size());

    size_t lineNumber = 1;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.empty() || line == "\r") {
            continue;
        }
        std::vector<std::string> cells = SplitLine(line);
        if (cells.size() != header.size()) {
            throw BoardException(filename + ":" + std::to_string(lineNumber) + " has " +
                                     std::to_string(cells.size()) + " columns, expected " +
                                     std::to_string(header.size()),
                                 StreamExitCodes::INVALID_ARGUMENTS_ERROR);
        }
        for (size_t column = 0; column < cells.size(); ++column) {
            try {
                size_t parsed = 0;
                double value = std::stod(cells[column], &parsed);
                if (parsed != cells[column].size()) {
                    throw std::invalid_argument("trailing characters");
                }
                matrix[column].push_back(value);
            } catch (const std::logic_error&) {
                throw BoardException(filename + ":" + std::to_string(lineNumber) + " bad value '" +
                                         cells[column] + "'",
                                     StreamExitCodes::INVALID_ARGUMENTS_ERROR);
            }
        }
    }

    LOG_DEBUG("Loaded " << (matrix.empty() ? 0 : matrix[0].size()) << " samples from " << filename);
    if (columnNames) {
        *columnNames = header;
    }
    return matrix;
}
