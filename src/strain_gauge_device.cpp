#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include <string>
#include "../include/strain_gauge_device.hpp"
#include "../include/acquisition_engine.hpp"
#include "../include/acquisition_scheduler.hpp"
#include "../include/arduino_digital_port.hpp"
#include "../include/calibrated_reader.hpp"
#include "../include/calibration_set.hpp"
#include "../include/calibrator.hpp"
#include "../include/config_manager.hpp"
#include "../include/data_storage.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"

StrainGaugeDevice::StrainGaugeDevice() {}

StrainGaugeDevice::~StrainGaugeDevice() {
    delete scheduler_;
    delete storage_;
    delete reader_;
    delete calibrator_;
    delete engine_;
    delete calibration_;
    delete port_;
    delete config_;
}

void StrainGaugeDevice::loadConfigFile(const char* config_file) {
    if (!LittleFS.exists(config_file)) {
        Logger::info("No %s found, using defaults", config_file);
        return;
    }
    File file = LittleFS.open(config_file, "r");
    if (!file) {
        Logger::warn("Could not open %s, using defaults", config_file);
        return;
    }
    String content = file.readString();
    file.close();
    std::string reason;
    if (!config_->loadFromJson(std::string(content.c_str()), reason)) {
        Logger::warn("Ignoring %s: %s", config_file, reason.c_str());
    }
}

bool StrainGaugeDevice::setup(const char* config_file) {
    if (!config_) {
        config_ = new ConfigManager();
        loadConfigFile(config_file);
    }
    Logger::begin(config_->getLoggingConfig());
    Logger::info("Strain gauge DAQ %s initializing...", config_->getDeviceId().c_str());

    ChannelSetConfig channels = config_->getChannelSetConfig();
    if (!port_) {
        port_ = new ArduinoDigitalPort();
    }
    if (!engine_) {
        try {
            engine_ = new AcquisitionEngine(port_, channels);
        } catch (const ConfigException& e) {
            Logger::error("Acquisition engine rejected config (code %d): %s", (int)e.code(), e.what());
            return false;
        }
        engine_->begin();
    }
    if (!calibration_) {
        calibration_ = new CalibrationSet(engine_->channelCount());
    }
    if (!calibrator_) {
        calibrator_ = new Calibrator(engine_, calibration_);
    }
    if (!reader_) {
        reader_ = new CalibratedReader(engine_, calibration_);
    }
    if (!storage_) {
        storage_ = new DataStorage(config_->getStorageConfig().csv_file);
        if (!storage_->begin(engine_->channelCount())) {
            Logger::warn("Storage unavailable, readings will only be logged");
        }
    }

    TareConfig tare_conf = config_->getTareConfig();
    if (tare_conf.on_boot) {
        TareResult result = tareWithRetries(tare_conf.max_attempts);
        if (result.status != AcquisitionStatus::SUCCESS) {
            Logger::warn("Running uncalibrated: %s", result.message.c_str());
        }
    }

    if (!scheduler_) {
        AcquisitionConfig acq_conf = config_->getAcquisitionConfig();
        scheduler_ = new AcquisitionScheduler(reader_, storage_);
        scheduler_->begin(acq_conf.polling_interval_ms, acq_conf.ready_timeout_ms);
        Logger::info("AcquisitionScheduler started, polling interval: %u ms",
                     (unsigned)acq_conf.polling_interval_ms);
    }
    return true;
}

void StrainGaugeDevice::loop() {
    if (scheduler_) scheduler_->loop();
}

TareResult StrainGaugeDevice::tareWithRetries(uint8_t attempts) {
    TareResult result;
    for (uint8_t attempt = 1; attempt <= attempts; attempt++) {
        result = tare();
        if (result.status == AcquisitionStatus::SUCCESS) break;
        // Retrying cannot fix a bad request, only a noisy or stalled one
        if (result.status == AcquisitionStatus::INSUFFICIENT_SAMPLES ||
            result.status == AcquisitionStatus::INVALID_ARGUMENT) break;
        Logger::warn("Tare attempt %u/%u failed: %s", (unsigned)attempt, (unsigned)attempts,
                     acquisitionStatusToString(result.status));
    }
    return result;
}

TareResult StrainGaugeDevice::tare() {
    if (!calibrator_) {
        TareResult result;
        result.status = AcquisitionStatus::NOT_READY;
        result.message = "Device not initialized";
        return result;
    }
    TareConfig conf = config_->getTareConfig();
    TareResult result = calibrator_->tare(conf.sample_count, conf.max_deviation_factor,
                                          conf.ready_timeout_ms);
    if (result.status == AcquisitionStatus::SUCCESS) tares_ok_++;
    else tares_failed_++;
    return result;
}

ReadResult StrainGaugeDevice::readOnce() {
    if (!reader_) return ReadResult();
    return reader_->readWithin(config_->getAcquisitionConfig().ready_timeout_ms);
}

RawReadResult StrainGaugeDevice::readRawOnce() {
    if (!engine_) return RawReadResult();
    return engine_->capture();
}

void StrainGaugeDevice::printChannels() const {
    if (!reader_) return;
    Logger::info("Channels (%s):", reader_->isCalibrated() ? "calibrated" : "uncalibrated");
    for (const Channel& ch : reader_->channels()) {
        Logger::info("  ch%u pin=%u offset=%.2f", (unsigned)ch.index, (unsigned)ch.data_pin, ch.offset);
    }
}

void StrainGaugeDevice::getStatistics(char* outBuf, size_t outBufSize) const {
    char sched[128] = "stopped";
    if (scheduler_) scheduler_->getStatistics(sched, sizeof(sched));
    snprintf(outBuf, outBufSize, "uptime=%lu, cycles=%lu, tares_ok=%lu, tares_failed=%lu, rows=%lu, %s",
             (unsigned long)millis(), engine_ ? (unsigned long)engine_->cycleCount() : 0UL,
             (unsigned long)tares_ok_, (unsigned long)tares_failed_,
             storage_ ? (unsigned long)storage_->rowsWritten() : 0UL, sched);
}
