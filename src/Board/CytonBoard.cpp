#include "CytonBoard.hpp"
#include "BoardException.hpp"
#include "board_log.hpp"

#include <chrono>
#include <cstring>

namespace {

// Soft reset answers with firmware info terminated by "$$$"
const char* const kInitEndMarker = "$$$";
const int kInitTimeoutMs = 3000;

} // namespace

CytonBoard::CytonBoard(const std::string& portName)
    : Board(static_cast<int>(BoardIds::CYTON_BOARD), portName)
    , _serial(portName) {
}

CytonBoard::~CytonBoard() {
    try {
        ReleaseSession();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to release Cyton session: " << e.what());
    }
}

void CytonBoard::OpenDevice() {
    if (_port_name.empty()) {
        throw BoardException("serial port is not specified", StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    _serial.Open();
    try {
        _serial.SetSettings();
        SendCommand("v");
        WaitForInitialMessage();
    } catch (const BoardException&) {
        _serial.Close();
        throw;
    }
}

void CytonBoard::StartDevice() {
    SendCommand("b");
}

void CytonBoard::StopDevice() {
    SendCommand("s");
}

void CytonBoard::CloseDevice() {
    _serial.Close();
}

void CytonBoard::SendCommand(const std::string& command) {
    LOG_TRACE("Sending command '" << command << "' to " << _port_name);
    if (_serial.SendToBoard(command) != static_cast<int>(command.size())) {
        throw BoardException("unable to send command '" + command + "' to board",
                             StreamExitCodes::BOARD_WRITE_ERROR);
    }
}

void CytonBoard::WaitForInitialMessage() {
    std::string received;
    unsigned char byte = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kInitTimeoutMs);

    while (std::chrono::steady_clock::now() < deadline) {
        int res = _serial.ReadFromSerialPort(&byte, 1);
        if (res < 0) {
            throw BoardException("unable to read initial message", StreamExitCodes::INCOMMING_MSG_ERROR);
        }
        if (res == 0) {
            continue;
        }
        received.push_back(static_cast<char>(byte));
        if (received.size() >= 3 &&
            received.compare(received.size() - 3, 3, kInitEndMarker) == 0) {
            LOG_DEBUG("Board initial message: " << received);
            return;
        }
    }
    throw BoardException("no initial message from board on " + _port_name,
                         StreamExitCodes::INITIAL_MSG_ERROR);
}

void CytonBoard::ReadData() {
    unsigned char packet[CytonPacketParser::PACKET_SIZE];
    float package[CytonPacketParser::PACKAGE_LENGTH];

    while (_keep_alive) {
        int res = _serial.ReadFromSerialPort(packet, 1);
        if (res < 0) {
            LOG_ERROR("Unable to read from " << _port_name);
            return;
        }
        if (res == 0 || packet[0] != CytonPacketParser::START_BYTE) {
            continue;
        }

        size_t received = 1;
        while (received < CytonPacketParser::PACKET_SIZE && _keep_alive) {
            res = _serial.ReadFromSerialPort(packet + received, CytonPacketParser::PACKET_SIZE - received);
            if (res < 0) {
                LOG_ERROR("Unable to read from " << _port_name);
                return;
            }
            received += static_cast<size_t>(res);
        }
        if (received < CytonPacketParser::PACKET_SIZE) {
            break;
        }

        if (!_parser.Parse(packet, package)) {
            LOG_WARN("Wrong end byte " << static_cast<int>(packet[CytonPacketParser::PACKET_SIZE - 1]));
            continue;
        }
        PushPackage(package);
    }
}
