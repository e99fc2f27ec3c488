#pragma once

#include <cstddef>
#include <string>

// Raw POSIX serial port used by the Cyton dongle (115200 8N1)
class SerialPort {
public:
    explicit SerialPort(const std::string& portName);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    // Throw BoardException on failure
    void Open();
    void SetSettings(unsigned int readTimeoutDeciseconds = 1);

    bool IsOpen() const { return _fd >= 0; }

    // Returns the number of bytes written, or -1 on error
    int SendToBoard(const std::string& message);
    // Returns the number of bytes read, 0 on timeout, or -1 on error
    int ReadFromSerialPort(unsigned char* buffer, size_t size);

    void Close();

    const std::string& GetPortName() const { return _port_name; }

private:
    std::string _port_name;
    int _fd;
};
