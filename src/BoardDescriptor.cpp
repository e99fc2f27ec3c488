#include "BoardDescriptor.hpp"
#include "BoardException.hpp"

namespace {

const BoardDescriptor kSyntheticBoard{
    static_cast<int>(BoardIds::SYNTHETIC_BOARD), "Synthetic", 250, 8, 12};

const BoardDescriptor kCytonBoard{
    static_cast<int>(BoardIds::CYTON_BOARD), "Cyton", 250, 8, 12};

} // namespace

const BoardDescriptor& GetBoardDescriptor(int board_id) {
    switch (static_cast<BoardIds>(board_id)) {
        case BoardIds::SYNTHETIC_BOARD: return kSyntheticBoard;
        case BoardIds::CYTON_BOARD: return kCytonBoard;
    }
    throw BoardException("unsupported board type " + std::to_string(board_id),
                         StreamExitCodes::UNSUPPORTED_BOARD_ERROR);
}

std::vector<std::string> GetColumnNames(int board_id) {
    const BoardDescriptor& descriptor = GetBoardDescriptor(board_id);

    std::vector<std::string> names;
    names.reserve(descriptor.NumRows());
    names.push_back("package_num");
    for (unsigned int i = 0; i < descriptor.numEegChannels; ++i) {
        names.push_back("eeg" + std::to_string(i + 1));
    }
    unsigned int otherChannels = descriptor.packageLength - 1 - descriptor.numEegChannels;
    for (unsigned int i = 0; i < otherChannels; ++i) {
        names.push_back("accel" + std::to_string(i + 1));
    }
    names.push_back("timestamp");
    return names;
}
