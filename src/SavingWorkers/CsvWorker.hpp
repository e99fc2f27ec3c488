#pragma once

#include <string>
#include <vector>

#include "ISavingWorker.hpp"

// Writes a header line with the column names, then one line per sample
class CsvWorker : public ISavingWorker {
public:
    explicit CsvWorker(const std::string& filename);

    bool Save() override;

    const std::string& GetFilename() const { return _filename; }

    // Reads a file written by Save(). Returns the matrix with rows = columns
    // of the file. Throws BoardException(INVALID_ARGUMENTS_ERROR) when the
    // file is missing or malformed.
    static SampleMatrix Load(const std::string& filename, std::vector<std::string>* columnNames = nullptr);

private:
    std::string _filename;
};
