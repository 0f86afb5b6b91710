#pragma once
#include <stdint.h>
#include <vector>
#include "acquisition_result.hpp"
#include "types.hpp"

class AcquisitionEngine;
class CalibrationSet;

/**
 * @brief Zero calibration (tare) with per-channel outlier rejection
 *
 * Collects sample_count cycles, drops every sample further than
 * max_deviation_factor standard deviations from its channel mean, and takes
 * the mean of what is left as the channel offset. A channel that keeps no
 * samples fails the tare. The calibration set is replaced only when the
 * whole tare succeeds.
 */
class Calibrator {
public:
    static const size_t kMinSamples = 100;
    // Tare fails when more than this share of all samples is discarded.
    static const size_t kMaxRejectedPercent = 20;

    Calibrator(AcquisitionEngine* engine, CalibrationSet* calibration);
    ~Calibrator() = default;

    /**
     * @param sample_count number of cycles to collect, at least kMinSamples
     * @param max_deviation_factor multiple of the channel std dev to keep
     * @param ready_timeout_ms per-sample ready wait; 0 waits forever
     * @param poll_interval_us back-off between polls when a timeout is set
     */
    TareResult tare(size_t sample_count, double max_deviation_factor,
                    uint32_t ready_timeout_ms = 0, uint32_t poll_interval_us = 100);

    // Mean, population std dev and the mean of the retained samples.
    static ChannelTareStats filterChannel(const std::vector<int32_t>& samples,
                                          double max_deviation_factor);

private:
    AcquisitionEngine* engine_ = nullptr;
    CalibrationSet* calibration_ = nullptr;

    bool collect(size_t sample_count, uint32_t ready_timeout_ms, uint32_t poll_interval_us,
                 std::vector<std::vector<int32_t>>& per_channel, size_t& collected);
};
