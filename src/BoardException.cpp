#include "BoardException.hpp"

namespace {

std::string FormatMessage(const std::string& message, StreamExitCodes exit_code) {
    return std::string(ExitCodeName(exit_code)) + ":" +
           std::to_string(static_cast<int>(exit_code)) + " " + message;
}

} // namespace

const char* ExitCodeName(StreamExitCodes code) {
    switch (code) {
        case StreamExitCodes::STATUS_OK: return "STATUS_OK";
        case StreamExitCodes::PORT_ALREADY_OPEN_ERROR: return "PORT_ALREADY_OPEN_ERROR";
        case StreamExitCodes::UNABLE_TO_OPEN_PORT_ERROR: return "UNABLE_TO_OPEN_PORT_ERROR";
        case StreamExitCodes::SET_PORT_ERROR: return "SET_PORT_ERROR";
        case StreamExitCodes::BOARD_WRITE_ERROR: return "BOARD_WRITE_ERROR";
        case StreamExitCodes::INCOMMING_MSG_ERROR: return "INCOMMING_MSG_ERROR";
        case StreamExitCodes::INITIAL_MSG_ERROR: return "INITIAL_MSG_ERROR";
        case StreamExitCodes::BOARD_NOT_READY_ERROR: return "BOARD_NOT_READY_ERROR";
        case StreamExitCodes::STREAM_ALREADY_RUN_ERROR: return "STREAM_ALREADY_RUN_ERROR";
        case StreamExitCodes::INVALID_BUFFER_SIZE_ERROR: return "INVALID_BUFFER_SIZE_ERROR";
        case StreamExitCodes::STREAM_THREAD_ERROR: return "STREAM_THREAD_ERROR";
        case StreamExitCodes::STREAM_THREAD_IS_NOT_RUNNING: return "STREAM_THREAD_IS_NOT_RUNNING";
        case StreamExitCodes::EMPTY_BUFFER_ERROR: return "EMPTY_BUFFER_ERROR";
        case StreamExitCodes::INVALID_ARGUMENTS_ERROR: return "INVALID_ARGUMENTS_ERROR";
        case StreamExitCodes::UNSUPPORTED_BOARD_ERROR: return "UNSUPPORTED_BOARD_ERROR";
        case StreamExitCodes::BOARD_NOT_CREATED_ERROR: return "BOARD_NOT_CREATED_ERROR";
    }
    return "UNKNOWN_ERROR";
}

BoardException::BoardException(const std::string& message, StreamExitCodes exit_code)
    : std::runtime_error(FormatMessage(message, exit_code))
    , _exit_code(exit_code) {
}
