#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "types.hpp"

enum class AcquisitionStatus {
    SUCCESS,
    NOT_READY,              // not every converter had DOUT low
    INSUFFICIENT_SAMPLES,   // tare asked for fewer than the minimum sample count
    EXCESSIVE_DEVIATION,    // tare discarded more than the allowed fraction
    TIMEOUT,                // bounded ready wait expired
    INVALID_ARGUMENT
};

struct RawReadResult {
    AcquisitionStatus status = AcquisitionStatus::NOT_READY;
    SampleVector samples;
};

struct ReadResult {
    AcquisitionStatus status = AcquisitionStatus::NOT_READY;
    CalibratedVector values;
};

// Per-channel outcome of the outlier filter.
struct ChannelTareStats {
    double mean = 0.0;
    double std_dev = 0.0;
    size_t retained = 0;
    double retained_mean = 0.0;
};

struct TareResult {
    AcquisitionStatus status = AcquisitionStatus::INSUFFICIENT_SAMPLES;
    std::string message;
    size_t samples_collected = 0;
    size_t retained_total = 0;
    size_t sample_total = 0;
    std::vector<ChannelTareStats> channels;
    std::vector<double> offsets;       // only filled on success
};

inline const char* acquisitionStatusToString(AcquisitionStatus status) {
    switch (status) {
        case AcquisitionStatus::SUCCESS: return "success";
        case AcquisitionStatus::NOT_READY: return "not_ready";
        case AcquisitionStatus::INSUFFICIENT_SAMPLES: return "insufficient_samples";
        case AcquisitionStatus::EXCESSIVE_DEVIATION: return "excessive_deviation";
        case AcquisitionStatus::TIMEOUT: return "timeout";
        case AcquisitionStatus::INVALID_ARGUMENT: return "invalid_argument";
        default: return "unknown";
    }
}
