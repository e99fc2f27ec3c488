#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

// Bounded ring of samples. Each sample is packageLength floats plus a
// timestamp. Once full, new samples overwrite the oldest ones.
// Producer is the board stream thread, consumer is the caller thread.
class DataBuffer {
public:
    DataBuffer(size_t numSamples, size_t packageLength);

    bool IsReady() const { return _is_ready; }

    void AddData(double timestamp, const float* package);

    size_t GetDataCount() const;

    // Removes up to maxCount oldest samples, oldest first.
    // Returns the number of samples copied into the output vectors.
    size_t GetData(size_t maxCount, std::vector<float>& packages, std::vector<double>& timestamps);

    // Copies up to maxCount newest samples, oldest first, without removing them.
    size_t GetCurrentData(size_t maxCount, std::vector<float>& packages,
                          std::vector<double>& timestamps) const;

    size_t GetCapacity() const { return _capacity; }
    size_t GetPackageLength() const { return _package_length; }

private:
    void CopySamples(size_t first, size_t count, std::vector<float>& packages,
                     std::vector<double>& timestamps) const;

    size_t _capacity;
    size_t _package_length;
    std::vector<float> _packages;
    std::vector<double> _timestamps;
    size_t _first_used;
    size_t _count;
    bool _is_ready;
    mutable std::mutex _mutex;
};
