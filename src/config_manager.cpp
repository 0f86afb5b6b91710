#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>

ConfigManager::ConfigManager() {
    initializeDefaults();
}

void ConfigManager::initializeDefaults() {
    device_id_ = "StrainDAQ001";

    // Four HX711 boards on one PD_SCK line
    channel_config_.clock_pin = 4;
    channel_config_.data_pins = {16, 17, 18, 19};
    channel_config_.gain = 128;
    channel_config_.debug = false;
    channel_config_.pulse_width_us = 1;

    acquisition_config_.polling_interval_ms = 100;
    acquisition_config_.ready_timeout_ms = 0;

    tare_config_.on_boot = true;
    tare_config_.sample_count = 200;
    tare_config_.max_deviation_factor = 2.0f;
    tare_config_.ready_timeout_ms = 300;
    tare_config_.max_attempts = 3;

    storage_config_.csv_file = "/data/strain.csv";

    logging_config_.log_level = "INFO";
    logging_config_.flush_on_write = true;
}

ConfigManager::~ConfigManager() {}

std::string ConfigManager::getDeviceId() const { return device_id_; }
ChannelSetConfig ConfigManager::getChannelSetConfig() const { return channel_config_; }
AcquisitionConfig ConfigManager::getAcquisitionConfig() const { return acquisition_config_; }
TareConfig ConfigManager::getTareConfig() const { return tare_config_; }
StorageConfig ConfigManager::getStorageConfig() const { return storage_config_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
ConfigValidationRules ConfigManager::getValidationRules() const { return validation_rules_; }

bool ConfigManager::validateGain(uint16_t gain, std::string& reason) const {
    GainMode mode;
    if (!gainModeFromValue(gain, mode)) {
        reason = "Invalid gain " + std::to_string(gain) + " (use 128 or 64)";
        return false;
    }
    return true;
}

bool ConfigManager::validateChannels(const ChannelSetConfig& channels, std::string& reason) const {
    if (!validateGain(channels.gain, reason)) return false;
    if (channels.pulse_width_us > 50) {
        // PD_SCK high for more than 60 us powers the HX711 down
        reason = "Pulse width too long (max: 50 us)";
        return false;
    }
    return validateChannelSetConfig(channels, reason);
}

bool ConfigManager::validatePollingInterval(uint32_t interval_ms, std::string& reason) const {
    if (interval_ms < validation_rules_.min_polling_interval_ms) {
        reason = "Polling interval too low (min: " +
                 std::to_string(validation_rules_.min_polling_interval_ms) + " ms)";
        return false;
    }
    if (interval_ms > validation_rules_.max_polling_interval_ms) {
        reason = "Polling interval too high (max: " +
                 std::to_string(validation_rules_.max_polling_interval_ms) + " ms)";
        return false;
    }
    return true;
}

bool ConfigManager::validateTare(const TareConfig& tare, std::string& reason) const {
    if (tare.sample_count < 100) {
        reason = "Tare sample count too low (min: 100)";
        return false;
    }
    if (tare.sample_count > validation_rules_.max_tare_samples) {
        reason = "Tare sample count too high (max: " +
                 std::to_string(validation_rules_.max_tare_samples) + ")";
        return false;
    }
    if (!(tare.max_deviation_factor >= 0.0f) ||
        tare.max_deviation_factor > validation_rules_.max_deviation_factor) {
        reason = "Deviation factor out of range (0 to " +
                 std::to_string((int)validation_rules_.max_deviation_factor) + ")";
        return false;
    }
    if (tare.max_attempts < 1 || tare.max_attempts > validation_rules_.max_tare_attempts) {
        reason = "Tare attempts out of range (1 to " +
                 std::to_string(validation_rules_.max_tare_attempts) + ")";
        return false;
    }
    return true;
}

bool ConfigManager::validateLogLevel(const std::string& level, std::string& reason) const {
    Logger::Level parsed;
    if (!Logger::levelFromString(level, parsed)) {
        reason = "Unknown log level: " + level;
        return false;
    }
    return true;
}

static bool readPin(JsonVariantConst value, PinId& pin, std::string& reason) {
    if (!value.is<int>()) {
        reason = "Pin numbers must be integers";
        return false;
    }
    int number = value.as<int>();
    if (number < 0 || number > 255) {
        reason = "Pin number out of range: " + std::to_string(number);
        return false;
    }
    pin = (PinId)number;
    return true;
}

bool ConfigManager::loadFromJson(const std::string& json, std::string& reason) {
    DynamicJsonDocument doc(2048);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        reason = std::string("JSON parse error: ") + error.c_str();
        Logger::warn("[ConfigMgr] %s", reason.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        reason = "Config root must be an object";
        Logger::warn("[ConfigMgr] %s", reason.c_str());
        return false;
    }

    // Work on copies; commit only when everything validates
    ChannelSetConfig channels = channel_config_;
    AcquisitionConfig acquisition = acquisition_config_;
    TareConfig tare = tare_config_;
    StorageConfig storage = storage_config_;
    LoggingConfig logging = logging_config_;
    std::string device_id = root["device_id"] | device_id_.c_str();

    JsonObjectConst ch = root["channels"];
    if (!ch.isNull()) {
        if (ch.containsKey("clock_pin") && !readPin(ch["clock_pin"], channels.clock_pin, reason)) {
            Logger::warn("[ConfigMgr] %s", reason.c_str());
            return false;
        }
        if (ch.containsKey("data_pins")) {
            JsonArrayConst pins = ch["data_pins"];
            if (pins.isNull()) {
                reason = "data_pins must be an array";
                Logger::warn("[ConfigMgr] %s", reason.c_str());
                return false;
            }
            channels.data_pins.clear();
            for (JsonVariantConst v : pins) {
                PinId pin = 0;
                if (!readPin(v, pin, reason)) {
                    Logger::warn("[ConfigMgr] %s", reason.c_str());
                    return false;
                }
                channels.data_pins.push_back(pin);
            }
        }
        channels.gain = ch["gain"] | channels.gain;
        channels.debug = ch["debug"] | channels.debug;
        channels.pulse_width_us = ch["pulse_width_us"] | channels.pulse_width_us;
    }

    JsonObjectConst acq = root["acquisition"];
    acquisition.polling_interval_ms = acq["polling_interval_ms"] | acquisition.polling_interval_ms;
    acquisition.ready_timeout_ms = acq["ready_timeout_ms"] | acquisition.ready_timeout_ms;

    JsonObjectConst tr = root["tare"];
    tare.on_boot = tr["on_boot"] | tare.on_boot;
    tare.sample_count = tr["sample_count"] | tare.sample_count;
    tare.max_deviation_factor = tr["max_deviation_factor"] | tare.max_deviation_factor;
    tare.ready_timeout_ms = tr["ready_timeout_ms"] | tare.ready_timeout_ms;
    tare.max_attempts = tr["max_attempts"] | tare.max_attempts;

    JsonObjectConst st = root["storage"];
    storage.csv_file = st["csv_file"] | storage.csv_file.c_str();

    JsonObjectConst lg = root["logging"];
    logging.log_level = lg["log_level"] | logging.log_level.c_str();
    logging.flush_on_write = lg["flush_on_write"] | logging.flush_on_write;

    if (!validateChannels(channels, reason) ||
        !validatePollingInterval(acquisition.polling_interval_ms, reason) ||
        !validateTare(tare, reason) ||
        !validateLogLevel(logging.log_level, reason)) {
        Logger::warn("[ConfigMgr] Rejected config: %s", reason.c_str());
        return false;
    }
    if (storage.csv_file.empty() || storage.csv_file[0] != '/') {
        reason = "csv_file must be an absolute path";
        Logger::warn("[ConfigMgr] Rejected config: %s", reason.c_str());
        return false;
    }

    device_id_ = device_id;
    channel_config_ = channels;
    acquisition_config_ = acquisition;
    tare_config_ = tare;
    storage_config_ = storage;
    logging_config_ = logging;
    Logger::info("[ConfigMgr] Loaded config: %u channel(s), gain %u, poll %u ms",
                 (unsigned)channel_config_.data_pins.size(), (unsigned)channel_config_.gain,
                 (unsigned)acquisition_config_.polling_interval_ms);
    return true;
}
