#include "Board.hpp"
#include "BoardException.hpp"
#include "board_log.hpp"

#include <chrono>
#include <system_error>

Board::Board(int boardId, const std::string& portName)
    : _descriptor(GetBoardDescriptor(boardId))
    , _port_name(portName)
    , _keep_alive(false)
    , _is_prepared(false)
    , _is_streaming(false) {
}

Board::~Board() {
    // Derived destructors release the session, the device is gone by now
    _keep_alive = false;
    if (_stream_thread && _stream_thread->joinable()) {
        _stream_thread->join();
    }
}

void Board::PrepareSession() {
    if (_is_prepared) {
        LOG_INFO("Session is already prepared");
        return;
    }
    OpenDevice();
    _is_prepared = true;
    LOG_INFO(_descriptor.name << " session is ready");
}

void Board::StartStream(int bufferSize) {
    if (bufferSize <= 0 || bufferSize > MAX_CAPTURE_SAMPLES) {
        throw BoardException("invalid buffer size " + std::to_string(bufferSize),
                             StreamExitCodes::INVALID_BUFFER_SIZE_ERROR);
    }
    if (!_is_prepared) {
        throw BoardException("session is not prepared", StreamExitCodes::BOARD_NOT_READY_ERROR);
    }
    if (_is_streaming) {
        throw BoardException("stream is already running", StreamExitCodes::STREAM_ALREADY_RUN_ERROR);
    }

    auto dataBuffer = std::make_unique<DataBuffer>(static_cast<size_t>(bufferSize),
                                                   _descriptor.packageLength);
    if (!dataBuffer->IsReady()) {
        throw BoardException("unable to allocate buffer of " + std::to_string(bufferSize) + " samples",
                             StreamExitCodes::INVALID_BUFFER_SIZE_ERROR);
    }
    _data_buffer = std::move(dataBuffer);

    StartDevice();

    _keep_alive = true;
    try {
        _stream_thread = std::make_unique<std::thread>(&Board::StreamThread, this);
    } catch (const std::system_error& e) {
        _keep_alive = false;
        StopDevice();
        throw BoardException(std::string("unable to start stream thread: ") + e.what(),
                             StreamExitCodes::STREAM_THREAD_ERROR);
    }
    _is_streaming = true;
    LOG_INFO("Started stream with buffer of " << bufferSize << " samples");
}

void Board::StopStream() {
    if (!_is_streaming) {
        throw BoardException("stream is not running", StreamExitCodes::STREAM_THREAD_IS_NOT_RUNNING);
    }
    _keep_alive = false;
    if (_stream_thread && _stream_thread->joinable()) {
        _stream_thread->join();
    }
    _stream_thread.reset();
    _is_streaming = false;

    StopDevice();
    LOG_INFO("Stopped stream");
}

void Board::ReleaseSession() {
    if (_is_streaming) {
        StopStream();
    }
    if (_is_prepared) {
        CloseDevice();
        _is_prepared = false;
        LOG_INFO(_descriptor.name << " session is released");
    }
}

int Board::GetBoardDataCount() const {
    if (!_data_buffer) {
        throw BoardException("data buffer is not created", StreamExitCodes::EMPTY_BUFFER_ERROR);
    }
    return static_cast<int>(_data_buffer->GetDataCount());
}

SampleMatrix Board::GetBoardData() {
    if (!_data_buffer) {
        throw BoardException("data buffer is not created", StreamExitCodes::EMPTY_BUFFER_ERROR);
    }
    std::vector<float> packages;
    std::vector<double> timestamps;
    size_t count = _data_buffer->GetData(_data_buffer->GetCapacity(), packages, timestamps);
    LOG_DEBUG("Got " << count << " samples from buffer");
    return ToSampleMatrix(packages, timestamps, count);
}

SampleMatrix Board::GetCurrentBoardData(int numSamples) const {
    if (numSamples <= 0) {
        throw BoardException("number of samples must be positive", StreamExitCodes::INVALID_ARGUMENTS_ERROR);
    }
    if (!_data_buffer) {
        throw BoardException("data buffer is not created", StreamExitCodes::EMPTY_BUFFER_ERROR);
    }
    std::vector<float> packages;
    std::vector<double> timestamps;
    size_t count = _data_buffer->GetCurrentData(static_cast<size_t>(numSamples), packages, timestamps);
    return ToSampleMatrix(packages, timestamps, count);
}

double Board::GetTimestamp() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1000000.0;
}

void Board::PushPackage(const float* package) {
    _data_buffer->AddData(GetTimestamp(), package);
}

void Board::StreamThread() {
    LOG_DEBUG("Stream thread started");
    try {
        ReadData();
    } catch (const std::exception& e) {
        LOG_ERROR("Stream thread stopped: " << e.what());
    }
    LOG_DEBUG("Stream thread finished");
}

SampleMatrix Board::ToSampleMatrix(const std::vector<float>& packages,
                                   const std::vector<double>& timestamps, size_t count) const {
    const unsigned int packageLength = _descriptor.packageLength;
    SampleMatrix matrix(_descriptor.NumRows(), std::vector<double>(count));
    for (size_t sample = 0; sample < count; ++sample) {
        for (unsigned int channel = 0; channel < packageLength; ++channel) {
            matrix[channel][sample] = packages[sample * packageLength + channel];
        }
        matrix[_descriptor.TimestampRow()][sample] = timestamps[sample];
    }
    return matrix;
}
