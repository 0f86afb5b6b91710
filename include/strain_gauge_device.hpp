#pragma once
#include <stdint.h>
#include <stddef.h>
#include "acquisition_result.hpp"

class AcquisitionEngine;
class AcquisitionScheduler;
class ArduinoDigitalPort;
class CalibratedReader;
class CalibrationSet;
class Calibrator;
class ConfigManager;
class DataStorage;

class StrainGaugeDevice {
public:
    StrainGaugeDevice();
    ~StrainGaugeDevice();

    StrainGaugeDevice(const StrainGaugeDevice&) = delete;
    StrainGaugeDevice& operator=(const StrainGaugeDevice&) = delete;

    // Returns false when the converters could not be brought up.
    bool setup(const char* config_file = "/config/config.json");
    void loop();

    // Console operations
    TareResult tare();
    ReadResult readOnce();
    RawReadResult readRawOnce();
    void printChannels() const;
    void getStatistics(char* outBuf, size_t outBufSize) const;
    bool isOperational() const { return engine_ != nullptr; }

private:
    ConfigManager* config_ = nullptr;
    ArduinoDigitalPort* port_ = nullptr;
    AcquisitionEngine* engine_ = nullptr;
    CalibrationSet* calibration_ = nullptr;
    Calibrator* calibrator_ = nullptr;
    CalibratedReader* reader_ = nullptr;
    DataStorage* storage_ = nullptr;
    AcquisitionScheduler* scheduler_ = nullptr;
    uint32_t tares_ok_ = 0;
    uint32_t tares_failed_ = 0;

    void loadConfigFile(const char* config_file);
    TareResult tareWithRetries(uint8_t attempts);
};
