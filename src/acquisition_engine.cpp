#include "../include/acquisition_engine.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <stdio.h>
#include <string>

const uint8_t AcquisitionEngine::kDataBits;

AcquisitionEngine::AcquisitionEngine(DigitalPort* port, const ChannelSetConfig& config)
    : port_(port), config_(config) {
    if (!port_) {
        throw ConfigException("AcquisitionEngine: no digital port", ERR_CONFIG);
    }
    setGain(config_.gain);
    std::string reason;
    if (!validateChannelSetConfig(config_, reason)) {
        throw ConfigException("AcquisitionEngine: " + reason, ERR_CONFIG);
    }
}

void AcquisitionEngine::begin() {
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
    port_->setDirection(config_.clock_pin, PinDirection::DIR_OUTPUT);
    for (PinId pin : config_.data_pins) {
        port_->setDirection(pin, PinDirection::DIR_INPUT);
    }
    powerUp();
    Logger::info("[Acq] %u channel(s) on PD_SCK pin %u, gain %u (%u extra pulses)",
                 (unsigned)channelCount(), (unsigned)config_.clock_pin,
                 (unsigned)gainModeValue(gain_mode_), (unsigned)gain_pulses_);
}

void AcquisitionEngine::setGain(uint16_t gain) {
    // 128 -> 25 pulses per cycle, 64 -> 27 pulses per cycle.
    if (!gainModeFromValue(gain, gain_mode_)) {
        throw ConfigException("AcquisitionEngine: invalid gain " + std::to_string(gain) +
                              " (use 128 or 64)", ERR_INVALID_GAIN);
    }
    gain_pulses_ = gainPulseCount(gain_mode_);
}

void AcquisitionEngine::powerUp() {
    // PD_SCK low takes the HX711 out of power-down.
    port_->write(config_.clock_pin, PinLevel::LEVEL_LOW);
    state_ = EngineState::POWERED;
}

bool AcquisitionEngine::isReady() {
    // DOUT carries data bits during a transfer; only sample it between cycles.
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);

    // DOUT goes low when a conversion is ready for retrieval.
    std::vector<size_t> not_ready;
    for (size_t i = 0; i < config_.data_pins.size(); i++) {
        if (port_->read(config_.data_pins[i]) == PinLevel::LEVEL_HIGH) {
            not_ready.push_back(i);
        }
    }
    bool ready = not_ready.empty();
    if (state_ != EngineState::UNINITIALIZED) {
        state_ = ready ? EngineState::READY : EngineState::NOT_READY;
    }

    if (config_.debug && !ready) {
        reportNotReady(not_ready);
    }
    return ready;
}

void AcquisitionEngine::reportNotReady(const std::vector<size_t>& channels) const {
    char buf[96];
    size_t len = 0;
    buf[0] = '\0';
    for (size_t ch : channels) {
        int n = snprintf(buf + len, sizeof(buf) - len, "%s%u(pin %u)", len ? ", " : "",
                         (unsigned)ch, (unsigned)config_.data_pins[ch]);
        if (n < 0 || (size_t)n >= sizeof(buf) - len) break;
        len += (size_t)n;
    }
    Logger::debug("[Acq] Not ready: channel %s", buf);
}

void AcquisitionEngine::pulseClock() {
    port_->write(config_.clock_pin, PinLevel::LEVEL_HIGH);
    if (config_.pulse_width_us) port_->delayMicros(config_.pulse_width_us);
    port_->write(config_.clock_pin, PinLevel::LEVEL_LOW);
    if (config_.pulse_width_us) port_->delayMicros(config_.pulse_width_us);
}

SampleVector AcquisitionEngine::readRaw() {
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);

    const size_t n = config_.data_pins.size();
    std::vector<uint32_t> accumulators(n, 0);

    // Each PD_SCK pulse shifts one bit out of every converter, MSB first.
    for (uint8_t bit = 0; bit < kDataBits; bit++) {
        pulseClock();
        for (size_t i = 0; i < n; i++) {
            accumulators[i] <<= 1;
            if (port_->read(config_.data_pins[i]) == PinLevel::LEVEL_HIGH) {
                accumulators[i] |= 1u;
            }
        }
    }

    // Gain and input for the next conversion.
    for (uint8_t i = 0; i < gain_pulses_; i++) {
        pulseClock();
    }

    SampleVector samples(n, 0);
    for (size_t i = 0; i < n; i++) {
        samples[i] = decodeTwosComplement24(accumulators[i]);
    }

    cycles_++;
    state_ = EngineState::NOT_READY;
    return samples;
}

RawReadResult AcquisitionEngine::capture() {
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
    RawReadResult result;
    if (!isReady()) {
        result.status = AcquisitionStatus::NOT_READY;
        return result;
    }
    result.samples = readRaw();
    result.status = AcquisitionStatus::SUCCESS;
    return result;
}

bool AcquisitionEngine::waitReady(uint32_t timeout_ms, uint32_t poll_interval_us) {
    uint32_t start;
    {
        std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
        start = port_->millis();
    }
    while (true) {
        // Held for one poll at a time.
        std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
        if (isReady()) return true;
        if ((uint32_t)(port_->millis() - start) >= timeout_ms) return false;
        if (poll_interval_us) port_->delayMicros(poll_interval_us);
    }
}

EngineState AcquisitionEngine::state() const {
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
    return state_;
}

uint32_t AcquisitionEngine::cycleCount() const {
    std::lock_guard<std::recursive_mutex> guard(bus_mutex_);
    return cycles_;
}

int32_t AcquisitionEngine::decodeTwosComplement24(uint32_t raw) {
    raw &= 0xFFFFFFu;
    if (raw & 0x800000u) {
        return (int32_t)raw - (int32_t)0x1000000;
    }
    return (int32_t)raw;
}
