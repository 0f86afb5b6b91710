#include "../include/calibration_set.hpp"

CalibrationSet::CalibrationSet(size_t channel_count) : offsets_(channel_count, 0.0) {}

bool CalibrationSet::replace(const std::vector<double>& offsets) {
    if (offsets.size() != offsets_.size()) return false;
    offsets_ = offsets;
    calibrated_ = true;
    return true;
}

double CalibrationSet::offset(size_t channel) const {
    if (channel >= offsets_.size()) return 0.0;
    return offsets_[channel];
}
