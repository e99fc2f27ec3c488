#include "SerialPort.hpp"
#include "BoardException.hpp"
#include "board_log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

SerialPort::SerialPort(const std::string& portName)
    : _port_name(portName)
    , _fd(-1) {
}

SerialPort::~SerialPort() {
    Close();
}

void SerialPort::Open() {
    if (IsOpen()) {
        throw BoardException("port " + _port_name + " is already open",
                             StreamExitCodes::PORT_ALREADY_OPEN_ERROR);
    }
    _fd = ::open(_port_name.c_str(), O_RDWR | O_NOCTTY);
    if (_fd < 0) {
        throw BoardException("unable to open port " + _port_name + ": " + std::strerror(errno),
                             StreamExitCodes::UNABLE_TO_OPEN_PORT_ERROR);
    }
    LOG_DEBUG("Opened serial port " << _port_name);
}

void SerialPort::SetSettings(unsigned int readTimeoutDeciseconds) {
    termios settings;
    std::memset(&settings, 0, sizeof(settings));
    if (tcgetattr(_fd, &settings) != 0) {
        throw BoardException("unable to read settings of " + _port_name + ": " + std::strerror(errno),
                             StreamExitCodes::SET_PORT_ERROR);
    }

    cfmakeraw(&settings);
    cfsetispeed(&settings, B115200);
    cfsetospeed(&settings, B115200);
    settings.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
    settings.c_cflag |= CS8 | CLOCAL | CREAD;
    settings.c_cc[VMIN] = 0;
    settings.c_cc[VTIME] = static_cast<cc_t>(readTimeoutDeciseconds);

    if (tcsetattr(_fd, TCSANOW, &settings) != 0) {
        throw BoardException("unable to configure " + _port_name + ": " + std::strerror(errno),
                             StreamExitCodes::SET_PORT_ERROR);
    }
    tcflush(_fd, TCIOFLUSH);
}

int SerialPort::SendToBoard(const std::string& message) {
    if (!IsOpen()) {
        return -1;
    }
    ssize_t written = ::write(_fd, message.data(), message.size());
    return static_cast<int>(written);
}

int SerialPort::ReadFromSerialPort(unsigned char* buffer, size_t size) {
    if (!IsOpen()) {
        return -1;
    }
    ssize_t bytesRead = ::read(_fd, buffer, size);
    return static_cast<int>(bytesRead);
}

void SerialPort::Close() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
        LOG_DEBUG("Closed serial port " << _port_name);
    }
}
