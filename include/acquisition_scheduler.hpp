#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "types.hpp"

class CalibratedReader;
class DataStorage;

class AcquisitionScheduler {
public:
    AcquisitionScheduler(CalibratedReader* reader, DataStorage* storage);
    ~AcquisitionScheduler();

    void begin(uint32_t interval_ms = 100, uint32_t ready_timeout_ms = 0);
    void end();
    void updateInterval(uint32_t interval_ms);
    void loop();
    bool isRunning() const { return running_; }
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    uint32_t pollInterval_ = 100;
    uint32_t printInterval_ = 15000;
    uint32_t readyTimeout_ = 0;
    uint32_t lastPoll_ = 0;
    uint32_t lastPrint_ = 0;
    bool running_ = false;
    CalibratedReader* reader_ = nullptr;
    DataStorage* storage_ = nullptr;
    std::vector<CalibratedVector> recentSamples_;
    uint32_t reads_ = 0;
    uint32_t notReady_ = 0;
    uint32_t storageErrors_ = 0;
    void pollTask();
    void printTask();
};
