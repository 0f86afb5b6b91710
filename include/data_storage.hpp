#pragma once
#include <stdint.h>
#include <string>
#include "types.hpp"

/**
 * @brief Append-only CSV sink on LittleFS
 *
 * Every append opens the file in append mode, writes one row in channel
 * order and closes it again, so a reset loses at most the row in flight.
 */
class DataStorage {
public:
    DataStorage(const std::string& filename = "/data/strain.csv");
    ~DataStorage();

    // Writes the column header if the file does not exist yet.
    bool begin(size_t channel_count);

    bool appendRow(const CalibratedVector& values);
    bool clearStorage();

    const std::string& filename() const { return filename_; }
    uint32_t rowsWritten() const { return rows_written_; }
    uint32_t writeFailures() const { return write_failures_; }

private:
    std::string filename_;
    uint32_t rows_written_ = 0;
    uint32_t write_failures_ = 0;

    bool appendLine(const std::string& line);
};
