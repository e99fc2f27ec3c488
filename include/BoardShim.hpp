#pragma once

#include <memory>
#include <string>

#include "BoardDescriptor.hpp"
#include "BoardException.hpp"

class Board;

// Session with one acquisition board. Every call throws BoardException on
// failure. The board is created by PrepareSession() and destroyed by
// ReleaseSession(); calls in between fail with BOARD_NOT_CREATED_ERROR.
class BoardShim {
public:
    static const int DEFAULT_BUFFER_SIZE = 3600 * 250;

    BoardShim(int board_id, const std::string& port_name);
    ~BoardShim();

    BoardShim(const BoardShim&) = delete;
    BoardShim& operator=(const BoardShim&) = delete;

    void PrepareSession();
    void StartStream(int num_samples = DEFAULT_BUFFER_SIZE);
    void StopStream();
    void ReleaseSession();

    bool IsPrepared() const;

    int GetBoardDataCount() const;
    // Drains the buffer. Rows are channels (see GetColumnNames), columns are samples.
    SampleMatrix GetBoardData();
    // Latest num_samples samples, the buffer keeps them
    SampleMatrix GetCurrentBoardData(int num_samples) const;
    SampleMatrix GetImmediateBoardData() const;

    int GetBoardId() const { return _board_id; }
    const BoardDescriptor& GetDescriptor() const { return _descriptor; }

    static void EnableBoardLogger();
    static void DisableBoardLogger();
    static void EnableDevBoardLogger();
    static void SetLogLevel(int log_level);

private:
    Board& RequireBoard() const;

    int _board_id;
    std::string _port_name;
    const BoardDescriptor& _descriptor;
    std::unique_ptr<Board> _board;
};
