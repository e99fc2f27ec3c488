#pragma once

#include <stdexcept>
#include <string>

enum class StreamExitCodes : int {
    STATUS_OK = 0,
    PORT_ALREADY_OPEN_ERROR = 1,
    UNABLE_TO_OPEN_PORT_ERROR = 2,
    SET_PORT_ERROR = 3,
    BOARD_WRITE_ERROR = 4,
    INCOMMING_MSG_ERROR = 5,
    INITIAL_MSG_ERROR = 6,
    BOARD_NOT_READY_ERROR = 7,
    STREAM_ALREADY_RUN_ERROR = 8,
    INVALID_BUFFER_SIZE_ERROR = 9,
    STREAM_THREAD_ERROR = 10,
    STREAM_THREAD_IS_NOT_RUNNING = 11,
    EMPTY_BUFFER_ERROR = 12,
    INVALID_ARGUMENTS_ERROR = 13,
    UNSUPPORTED_BOARD_ERROR = 14,
    BOARD_NOT_CREATED_ERROR = 15
};

const char* ExitCodeName(StreamExitCodes code);

// what() reads "<CODE_NAME>:<code> <message>"
class BoardException : public std::runtime_error {
public:
    BoardException(const std::string& message, StreamExitCodes exit_code);

    StreamExitCodes GetExitCode() const { return _exit_code; }
    int GetExitCodeValue() const { return static_cast<int>(_exit_code); }

private:
    StreamExitCodes _exit_code;
};
