#pragma once

#include <string>
#include <vector>

enum class BoardIds : int {
    SYNTHETIC_BOARD = -1,
    CYTON_BOARD = 0
};

// rows = channels, columns = samples
using SampleMatrix = std::vector<std::vector<double>>;

struct BoardDescriptor {
    int boardId;
    std::string name;
    unsigned int samplingRate;
    unsigned int numEegChannels;
    // Columns produced by the device per sample: package number, EEG, accel
    unsigned int packageLength;

    // Matrix rows: the package columns plus a trailing timestamp row
    unsigned int NumRows() const { return packageLength + 1; }
    unsigned int FirstEegRow() const { return 1; }
    unsigned int TimestampRow() const { return packageLength; }
};

// Throws BoardException(UNSUPPORTED_BOARD_ERROR) for unknown ids
const BoardDescriptor& GetBoardDescriptor(int board_id);

std::vector<std::string> GetColumnNames(int board_id);
