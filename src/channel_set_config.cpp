#include "../include/channel_set_config.hpp"

bool gainModeFromValue(uint16_t gain, GainMode& mode) {
    switch (gain) {
        case 128: mode = GainMode::GAIN_128; return true;
        case 64:  mode = GainMode::GAIN_64;  return true;
        default:  return false;
    }
}

uint8_t gainPulseCount(GainMode mode) {
    switch (mode) {
        case GainMode::GAIN_128: return 1;
        case GainMode::GAIN_64:  return 3;
    }
    return 1;
}

uint16_t gainModeValue(GainMode mode) {
    return mode == GainMode::GAIN_64 ? 64 : 128;
}

bool validateChannelSetConfig(const ChannelSetConfig& config, std::string& reason) {
    GainMode mode;
    if (!gainModeFromValue(config.gain, mode)) {
        reason = "Invalid gain " + std::to_string(config.gain) + " (use 128 or 64)";
        return false;
    }
    if (config.data_pins.empty()) {
        reason = "At least one data pin is required";
        return false;
    }
    if (config.data_pins.size() > kMaxChannels) {
        reason = "Too many channels (max: " + std::to_string(kMaxChannels) + ")";
        return false;
    }
    for (size_t i = 0; i < config.data_pins.size(); i++) {
        if (config.data_pins[i] == config.clock_pin) {
            reason = "Data pin " + std::to_string(config.data_pins[i]) + " is also the clock pin";
            return false;
        }
        for (size_t j = i + 1; j < config.data_pins.size(); j++) {
            if (config.data_pins[i] == config.data_pins[j]) {
                reason = "Duplicate data pin: " + std::to_string(config.data_pins[i]);
                return false;
            }
        }
    }
    return true;
}
