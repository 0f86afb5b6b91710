#pragma once
#include <stdint.h>
#include <string>
#include "channel_set_config.hpp"

struct LoggingConfig {
    std::string log_level;
    bool flush_on_write;
};

struct AcquisitionConfig {
    uint32_t polling_interval_ms;
    uint32_t ready_timeout_ms;      // 0 = single readiness check per tick
};

struct TareConfig {
    bool on_boot;
    uint32_t sample_count;
    float max_deviation_factor;
    uint32_t ready_timeout_ms;      // 0 = wait forever for each sample
    uint8_t max_attempts;
};

struct StorageConfig {
    std::string csv_file;
};
