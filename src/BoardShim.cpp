#include "BoardShim.hpp"
#include "Board/Board.hpp"
#include "Board/CytonBoard.hpp"
#include "Board/SyntheticBoard.hpp"
#include "board_log.hpp"

namespace {

std::unique_ptr<Board> CreateBoard(int board_id, const std::string& port_name) {
    switch (static_cast<BoardIds>(board_id)) {
        case BoardIds::SYNTHETIC_BOARD: return std::make_unique<SyntheticBoard>(port_name);
        case BoardIds::CYTON_BOARD: return std::make_unique<CytonBoard>(port_name);
    }
    throw BoardException("unsupported board type " + std::to_string(board_id),
                         StreamExitCodes::UNSUPPORTED_BOARD_ERROR);
}

} // namespace

BoardShim::BoardShim(int board_id, const std::string& port_name)
    : _board_id(board_id)
    , _port_name(port_name)
    , _descriptor(GetBoardDescriptor(board_id)) {
}

BoardShim::~BoardShim() = default;

void BoardShim::PrepareSession() {
    if (_board) {
        LOG_INFO("Session is already prepared for " << _descriptor.name);
        return;
    }
    std::unique_ptr<Board> board = CreateBoard(_board_id, _port_name);
    board->PrepareSession();
    _board = std::move(board);
}

void BoardShim::StartStream(int num_samples) {
    RequireBoard().StartStream(num_samples);
}

void BoardShim::StopStream() {
    RequireBoard().StopStream();
}

void BoardShim::ReleaseSession() {
    if (!_board) {
        return;
    }
    _board->ReleaseSession();
    _board.reset();
}

bool BoardShim::IsPrepared() const {
    return _board && _board->IsPrepared();
}

int BoardShim::GetBoardDataCount() const {
    return RequireBoard().GetBoardDataCount();
}

SampleMatrix BoardShim::GetBoardData() {
    return RequireBoard().GetBoardData();
}

SampleMatrix BoardShim::GetCurrentBoardData(int num_samples) const {
    return RequireBoard().GetCurrentBoardData(num_samples);
}

SampleMatrix BoardShim::GetImmediateBoardData() const {
    return GetCurrentBoardData(1);
}

void BoardShim::EnableBoardLogger() {
    SetLogLevel(static_cast<int>(LogLevel::Info));
}

void BoardShim::DisableBoardLogger() {
    SetLogLevel(static_cast<int>(LogLevel::Off));
}

void BoardShim::EnableDevBoardLogger() {
    SetLogLevel(static_cast<int>(LogLevel::Trace));
}

void BoardShim::SetLogLevel(int log_level) {
    if (log_level < static_cast<int>(LogLevel::Trace) || log_level > static_cast<int>(LogLevel::Off)) {
        throw BoardException("invalid log level " + std::to_string(log_level),
                             StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    board_log::SetLevel(static_cast<LogLevel>(log_level));
}

Board& BoardShim::RequireBoard() const {
    if (!_board) {
        throw BoardException("board is not created, call PrepareSession first",
                             StreamExitCodes::BOARD_NOT_CREATED_ERROR);
    }
    return *_board;
}
