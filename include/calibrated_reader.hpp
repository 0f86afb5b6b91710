#pragma once
#include <stdint.h>
#include <vector>
#include "acquisition_result.hpp"
#include "types.hpp"

class AcquisitionEngine;
class CalibrationSet;

class CalibratedReader {
public:
    CalibratedReader(AcquisitionEngine* engine, const CalibrationSet* calibration);
    ~CalibratedReader() = default;

    // One cycle, offsets applied. NOT_READY if any converter is still busy.
    ReadResult read();

    // Waits up to timeout_ms for every converter, then reads. TIMEOUT on expiry.
    // A zero timeout is a single read().
    ReadResult readWithin(uint32_t timeout_ms, uint32_t poll_interval_us = 100);

    CalibratedVector apply(const SampleVector& raw) const;
    std::vector<Channel> channels() const;
    bool isCalibrated() const;

private:
    AcquisitionEngine* engine_ = nullptr;
    const CalibrationSet* calibration_ = nullptr;
};
