#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include "../include/data_storage.hpp"
#include "../include/csv_row.hpp"
#include "../include/logger.hpp"

DataStorage::DataStorage(const std::string& filename) : filename_(filename) {}

DataStorage::~DataStorage() {}

bool DataStorage::begin(size_t channel_count) {
    if (LittleFS.exists(filename_.c_str())) return true;
    std::string header;
    for (size_t i = 0; i < channel_count; i++) {
        if (i) header += ',';
        header += "ch" + std::to_string(i);
    }
    if (!appendLine(header)) {
        Logger::error("[Storage] Could not create %s", filename_.c_str());
        return false;
    }
    Logger::info("[Storage] Created %s", filename_.c_str());
    return true;
}

bool DataStorage::appendRow(const CalibratedVector& values) {
    if (!appendLine(formatCsvRow(values))) return false;
    rows_written_++;
    return true;
}

bool DataStorage::clearStorage() {
    if (!LittleFS.exists(filename_.c_str())) return true;
    return LittleFS.remove(filename_.c_str());
}

bool DataStorage::appendLine(const std::string& line) {
    File file = LittleFS.open(filename_.c_str(), "a");
    if (!file) {
        write_failures_++;
        Logger::warn("[Storage] Failed to open %s for append", filename_.c_str());
        return false;
    }
    size_t written = file.print(line.c_str());
    written += file.print("\n");
    file.close();
    if (written != line.size() + 1) {
        write_failures_++;
        Logger::warn("[Storage] Short write to %s (%u of %u bytes)", filename_.c_str(),
                     (unsigned)written, (unsigned)(line.size() + 1));
        return false;
    }
    return true;
}
