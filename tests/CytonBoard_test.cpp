#include "BoardShim.hpp"
#include "Board/CytonPacketParser.hpp"
#include "Board/SerialPort.hpp"
#include "cyton_packets.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace {

const int kCyton = static_cast<int>(BoardIds::CYTON_BOARD);
const int32_t kEegCounts = 1000;
const int16_t kAccelCounts = 160;

// Pseudo terminal standing in for a Cyton dongle. Answers the soft reset,
// streams packets between 'b' and 's' and records every command it gets.
class FakeCytonDevice {
public:
    explicit FakeCytonDevice(bool answerReset)
        : _answer_reset(answerReset) {
        _master = posix_openpt(O_RDWR | O_NOCTTY);
        if (_master < 0 || grantpt(_master) != 0 || unlockpt(_master) != 0) {
            throw std::runtime_error("unable to create pseudo terminal");
        }
        fcntl(_master, F_SETFL, fcntl(_master, F_GETFL) | O_NONBLOCK);
        _slave_path = ptsname(_master);
        _device_thread = std::thread(&FakeCytonDevice::Run, this);
    }

    ~FakeCytonDevice() {
        _keep_alive = false;
        _device_thread.join();
        ::close(_master);
    }

    const std::string& GetPortName() const { return _slave_path; }

    std::string GetCommands() {
        std::lock_guard<std::mutex> lock(_commands_mutex);
        return _commands;
    }

    // Commands travel through the pty asynchronously
    bool WaitForCommands(const std::string& expected) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            if (GetCommands() == expected) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

private:
    void Run() {
        unsigned char packageNum = 0;
        while (_keep_alive) {
            pollfd pfd{_master, POLLIN, 0};
            int res = poll(&pfd, 1, 4);
            if (res > 0 && (pfd.revents & POLLIN)) {
                char command = 0;
                while (::read(_master, &command, 1) == 1) {
                    HandleCommand(command);
                }
            }
            // POLLHUP until the slave side is opened and after it is closed
            if (res > 0 && (pfd.revents & POLLHUP)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            if (_streaming) {
                unsigned char packet[CytonPacketParser::PACKET_SIZE];
                cyton_packets::MakePacket(packet, packageNum++, kEegCounts, kAccelCounts, 0xC0);
                Write(packet, sizeof(packet));
            }
        }
    }

    void HandleCommand(char command) {
        {
            std::lock_guard<std::mutex> lock(_commands_mutex);
            _commands.push_back(command);
        }
        if (command == 'v' && _answer_reset) {
            const char reply[] = "OpenBCI V3 8-16 channel\nADS1299 Device ID: 0x3E\nFirmware: v3.1.2\n$$$";
            Write(reinterpret_cast<const unsigned char*>(reply), std::strlen(reply));
        } else if (command == 'b') {
            _streaming = true;
        } else if (command == 's') {
            _streaming = false;
        }
    }

    void Write(const unsigned char* bytes, size_t size) {
        // Drops the bytes when nobody reads the slave side
        if (::write(_master, bytes, size) < 0) {
            return;
        }
    }

    bool _answer_reset;
    int _master = -1;
    std::string _slave_path;
    std::atomic<bool> _keep_alive{true};
    std::atomic<bool> _streaming{false};
    std::mutex _commands_mutex;
    std::string _commands;
    std::thread _device_thread;
};

class CytonBoardTest : public ::testing::Test {
protected:
    void SetUp() override { BoardShim::DisableBoardLogger(); }
};

} // namespace

TEST_F(CytonBoardTest, StreamsPacketsFromDevice) {
    FakeCytonDevice device(true);
    BoardShim boardShim(kCyton, device.GetPortName());

    boardShim.PrepareSession();
    boardShim.StartStream(3600);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    boardShim.StopStream();

    int count = boardShim.GetBoardDataCount();
    EXPECT_GT(count, 0);
    SampleMatrix data = boardShim.GetBoardData();
    ASSERT_EQ(data.size(), 13u);
    ASSERT_EQ(data[0].size(), static_cast<size_t>(count));

    for (int channel = 0; channel < 8; ++channel) {
        EXPECT_NEAR(data[1 + channel][0], kEegCounts * (channel + 1) * CytonPacketParser::EEG_SCALE, 1e-3)
            << "eeg" << channel + 1;
    }
    for (int axis = 0; axis < 3; ++axis) {
        EXPECT_NEAR(data[9 + axis][0], kAccelCounts * (axis + 1) * CytonPacketParser::ACCEL_SCALE, 1e-6)
            << "accel" << axis + 1;
    }
    EXPECT_GT(data[12][0], 1600000000.0);

    EXPECT_TRUE(device.WaitForCommands("vbs")) << "got " << device.GetCommands();
    boardShim.ReleaseSession();
}

TEST_F(CytonBoardTest, SilentDeviceFailsInitialization) {
    FakeCytonDevice device(false);
    BoardShim boardShim(kCyton, device.GetPortName());

    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::INITIAL_MSG_ERROR,
                                             [&]() { boardShim.PrepareSession(); }));
    EXPECT_FALSE(boardShim.IsPrepared());
    EXPECT_TRUE(device.WaitForCommands("v")) << "got " << device.GetCommands();
}

TEST_F(CytonBoardTest, PortErrors) {
    BoardShim missingPort(kCyton, "/dev/biostream_no_such_port");
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::UNABLE_TO_OPEN_PORT_ERROR,
                                             [&]() { missingPort.PrepareSession(); }));

    BoardShim emptyPort(kCyton, "");
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::INVALID_ARGUMENTS_ERROR,
                                             [&]() { emptyPort.PrepareSession(); }));
}

TEST_F(CytonBoardTest, SerialPortRoundTrip) {
    FakeCytonDevice device(true);
    SerialPort port(device.GetPortName());

    EXPECT_EQ(port.SendToBoard("v"), -1) << "closed port must not write";
    port.Open();
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::PORT_ALREADY_OPEN_ERROR,
                                             [&]() { port.Open(); }));
    port.SetSettings();

    ASSERT_EQ(port.SendToBoard("v"), 1);
    std::string reply;
    unsigned char byte = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline && reply.find("$$$") == std::string::npos) {
        if (port.ReadFromSerialPort(&byte, 1) == 1) {
            reply.push_back(static_cast<char>(byte));
        }
    }
    EXPECT_NE(reply.find("OpenBCI"), std::string::npos);
    EXPECT_NE(reply.find("$$$"), std::string::npos);

    port.Close();
    EXPECT_FALSE(port.IsOpen());
    EXPECT_EQ(port.ReadFromSerialPort(&byte, 1), -1);
}
