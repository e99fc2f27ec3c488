#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "BoardDescriptor.hpp"

class SavingWorkerException : public std::runtime_error {
public:
    explicit SavingWorkerException(const std::string& message)
        : std::runtime_error(message) {
    }
};

// Persists a sample matrix. Save() returns false on I/O failure and throws
// SavingWorkerException when the worker was not given what it needs.
class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    virtual bool Save() = 0;

    void SetColumnNames(const std::vector<std::string>& names) {
        _column_names = names;
        _names_set = true;
    }

    void SetData(const SampleMatrix& data) {
        _data = data;
        _data_set = true;
    }

protected:
    std::vector<std::string> _column_names;
    SampleMatrix _data;
    bool _names_set = false;
    bool _data_set = false;
};
