#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "BoardDescriptor.hpp"
#include "DataBuffer/DataBuffer.hpp"

// Session lifecycle shared by every device. Concrete boards open and close
// the device and produce packages from ReadData(), which runs on the
// stream thread until _keep_alive is cleared.
class Board {
public:
    static const int MAX_CAPTURE_SAMPLES = 86400 * 250;

    Board(int boardId, const std::string& portName);
    virtual ~Board();

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    void PrepareSession();
    void StartStream(int bufferSize);
    void StopStream();
    void ReleaseSession();

    int GetBoardDataCount() const;
    SampleMatrix GetBoardData();
    SampleMatrix GetCurrentBoardData(int numSamples) const;

    bool IsPrepared() const { return _is_prepared; }
    bool IsStreaming() const { return _is_streaming; }
    const BoardDescriptor& GetDescriptor() const { return _descriptor; }
    const std::string& GetPortName() const { return _port_name; }

    static double GetTimestamp();

protected:
    virtual void OpenDevice() = 0;
    virtual void StartDevice() = 0;
    virtual void StopDevice() = 0;
    virtual void CloseDevice() = 0;
    virtual void ReadData() = 0;

    void PushPackage(const float* package);

    const BoardDescriptor& _descriptor;
    std::string _port_name;
    std::atomic<bool> _keep_alive;

private:
    void StreamThread();
    SampleMatrix ToSampleMatrix(const std::vector<float>& packages,
                                const std::vector<double>& timestamps, size_t count) const;

    bool _is_prepared;
    bool _is_streaming;
    std::unique_ptr<std::thread> _stream_thread;
    std::unique_ptr<DataBuffer> _data_buffer;
};
