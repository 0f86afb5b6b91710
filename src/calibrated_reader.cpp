#include "../include/calibrated_reader.hpp"
#include "../include/acquisition_engine.hpp"
#include "../include/calibration_set.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <mutex>

CalibratedReader::CalibratedReader(AcquisitionEngine* engine, const CalibrationSet* calibration)
    : engine_(engine), calibration_(calibration) {
    if (!engine_ || !calibration_) {
        throw ConfigException("CalibratedReader: engine and calibration set are required", ERR_CONFIG);
    }
    if (calibration_->size() != engine_->channelCount()) {
        throw ConfigException("CalibratedReader: offset count does not match channel count", ERR_CONFIG);
    }
}

ReadResult CalibratedReader::read() {
    ReadResult result;
    RawReadResult raw = engine_->capture();
    result.status = raw.status;
    if (raw.status != AcquisitionStatus::SUCCESS) {
        Logger::debug("[Reader] Read skipped: %s", acquisitionStatusToString(raw.status));
        return result;
    }
    result.values = apply(raw.samples);
    return result;
}

ReadResult CalibratedReader::readWithin(uint32_t timeout_ms, uint32_t poll_interval_us) {
    if (timeout_ms == 0) return read();

    ReadResult result;
    std::lock_guard<AcquisitionEngine> bus(*engine_);
    if (!engine_->waitReady(timeout_ms, poll_interval_us)) {
        result.status = AcquisitionStatus::TIMEOUT;
        Logger::warn("[Reader] Converters not ready within %u ms", (unsigned)timeout_ms);
        return result;
    }
    result.values = apply(engine_->readRaw());
    result.status = AcquisitionStatus::SUCCESS;
    return result;
}

CalibratedVector CalibratedReader::apply(const SampleVector& raw) const {
    CalibratedVector values(raw.size(), 0.0);
    for (size_t i = 0; i < raw.size(); i++) {
        values[i] = (double)raw[i] - calibration_->offset(i);
    }
    return values;
}

std::vector<Channel> CalibratedReader::channels() const {
    const std::vector<PinId>& pins = engine_->config().data_pins;
    std::vector<Channel> out;
    out.reserve(pins.size());
    for (size_t i = 0; i < pins.size(); i++) {
        Channel ch;
        ch.index = i;
        ch.data_pin = pins[i];
        ch.offset = calibration_->offset(i);
        out.push_back(ch);
    }
    return out;
}

bool CalibratedReader::isCalibrated() const {
    return calibration_->isCalibrated();
}
