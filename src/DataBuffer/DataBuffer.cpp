#include "DataBuffer.hpp"

#include <algorithm>
#include <cstring>
#include <new>

DataBuffer::DataBuffer(size_t numSamples, size_t packageLength)
    : _capacity(numSamples)
    , _package_length(packageLength)
    , _first_used(0)
    , _count(0)
    , _is_ready(false) {
    if (numSamples == 0 || packageLength == 0) {
        return;
    }
    try {
        _packages.resize(numSamples * packageLength);
        _timestamps.resize(numSamples);
        _is_ready = true;
    } catch (const std::bad_alloc&) {
        _packages.clear();
        _timestamps.clear();
    }
}

void DataBuffer::AddData(double timestamp, const float* package) {
    if (!_is_ready || !package) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);

    size_t position = (_first_used + _count) % _capacity;
    std::memcpy(&_packages[position * _package_length], package, _package_length * sizeof(float));
    _timestamps[position] = timestamp;

    if (_count < _capacity) {
        ++_count;
    } else {
        _first_used = (_first_used + 1) % _capacity;
    }
}

size_t DataBuffer::GetDataCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _count;
}

size_t DataBuffer::GetData(size_t maxCount, std::vector<float>& packages,
                           std::vector<double>& timestamps) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_is_ready) {
        packages.clear();
        timestamps.clear();
        return 0;
    }

    size_t count = std::min(maxCount, _count);
    CopySamples(_first_used, count, packages, timestamps);
    _first_used = (_first_used + count) % _capacity;
    _count -= count;
    return count;
}

size_t DataBuffer::GetCurrentData(size_t maxCount, std::vector<float>& packages,
                                  std::vector<double>& timestamps) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_is_ready) {
        packages.clear();
        timestamps.clear();
        return 0;
    }

    size_t count = std::min(maxCount, _count);
    size_t first = (_first_used + _count - count) % _capacity;
    CopySamples(first, count, packages, timestamps);
    return count;
}

void DataBuffer::CopySamples(size_t first, size_t count, std::vector<float>& packages,
                             std::vector<double>& timestamps) const {
    packages.resize(count * _package_length);
    timestamps.resize(count);
    for (size_t i = 0; i < count; ++i) {
        size_t position = (first + i) % _capacity;
        std::memcpy(&packages[i * _package_length], &_packages[position * _package_length],
                    _package_length * sizeof(float));
        timestamps[i] = _timestamps[position];
    }
}
