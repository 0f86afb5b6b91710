#pragma once
#include <stddef.h>
#include <vector>

/**
 * @brief Per-channel tare offsets
 *
 * Starts as all zeros (uncalibrated). Only replace() changes it, and only
 * when the new set has exactly one offset per channel.
 */
class CalibrationSet {
public:
    explicit CalibrationSet(size_t channel_count);

    bool replace(const std::vector<double>& offsets);

    double offset(size_t channel) const;
    const std::vector<double>& offsets() const { return offsets_; }
    size_t size() const { return offsets_.size(); }
    bool isCalibrated() const { return calibrated_; }

private:
    std::vector<double> offsets_;
    bool calibrated_ = false;
};
