#pragma once
#include <stdint.h>
#include <vector>
#include <string>
#include "channel_set_config.hpp"
#include "device_config.hpp"

// Validation constraints
struct ConfigValidationRules {
    uint32_t min_polling_interval_ms = 10;      // HX711 runs at 10 or 80 SPS
    uint32_t max_polling_interval_ms = 60000;
    uint32_t max_tare_samples = 2000;            // tare buffers every cycle in RAM
    float max_deviation_factor = 10.0f;
    uint8_t max_tare_attempts = 10;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    std::string getDeviceId() const;
    ChannelSetConfig getChannelSetConfig() const;
    AcquisitionConfig getAcquisitionConfig() const;
    TareConfig getTareConfig() const;
    StorageConfig getStorageConfig() const;
    LoggingConfig getLoggingConfig() const;

    /**
     * @brief Overlay settings from a JSON document onto the current config
     *
     * Missing keys keep their current value. If any supplied value is invalid
     * nothing is applied and reason explains the first problem found.
     */
    bool loadFromJson(const std::string& json, std::string& reason);

    bool validateGain(uint16_t gain, std::string& reason) const;
    bool validateChannels(const ChannelSetConfig& channels, std::string& reason) const;
    bool validatePollingInterval(uint32_t interval_ms, std::string& reason) const;
    bool validateTare(const TareConfig& tare, std::string& reason) const;
    bool validateLogLevel(const std::string& level, std::string& reason) const;

    ConfigValidationRules getValidationRules() const;

private:
    std::string device_id_;
    ChannelSetConfig channel_config_;
    AcquisitionConfig acquisition_config_;
    TareConfig tare_config_;
    StorageConfig storage_config_;
    LoggingConfig logging_config_;
    ConfigValidationRules validation_rules_;

    void initializeDefaults();
};
