#pragma once

#include "Board.hpp"
#include "CytonPacketParser.hpp"
#include "SerialPort.hpp"

// OpenBCI Cyton (8 EEG channels at 250 Hz) connected through its USB dongle
class CytonBoard : public Board {
public:
    explicit CytonBoard(const std::string& portName);
    ~CytonBoard() override;

protected:
    void OpenDevice() override;
    void StartDevice() override;
    void StopDevice() override;
    void CloseDevice() override;
    void ReadData() override;

private:
    void SendCommand(const std::string& command);
    void WaitForInitialMessage();

    SerialPort _serial;
    CytonPacketParser _parser;
};
