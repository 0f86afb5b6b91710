#pragma once
#include <stdint.h>
#include <mutex>
#include <vector>
#include "acquisition_result.hpp"
#include "channel_set_config.hpp"
#include "digital_port.hpp"
#include "types.hpp"

enum class EngineState {
    UNINITIALIZED,
    POWERED,
    NOT_READY,
    READY
};

/**
 * @brief Bit-banged reader for N HX711 converters sharing one PD_SCK line
 *
 * Every channel has its own DOUT pin; all of them are sampled on the same
 * clock pulse. The engine is BasicLockable: hold the lock to keep the clock
 * line to yourself across several cycles (a tare does this). readRaw() takes
 * it for a single cycle on its own.
 */
class AcquisitionEngine {
public:
    static const uint8_t kDataBits = 24;

    // Throws ConfigException (ERR_INVALID_GAIN / ERR_CONFIG) on a bad config.
    AcquisitionEngine(DigitalPort* port, const ChannelSetConfig& config);
    ~AcquisitionEngine() = default;

    AcquisitionEngine(const AcquisitionEngine&) = delete;
    AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;

    // Configures pin directions and powers the converters up (PD_SCK low).
    void begin();

    bool isReady();

    /**
     * @brief Clock one conversion out of every converter
     *
     * Caller contract: isReady() returned true immediately before. Issues 24
     * data pulses, then the gain pulses for the next conversion.
     */
    SampleVector readRaw();

    // readRaw() guarded by a readiness check. NOT_READY leaves the clock idle.
    RawReadResult capture();

    /**
     * @brief Poll isReady() until it holds or timeout_ms elapses
     * @param poll_interval_us back-off between polls
     */
    bool waitReady(uint32_t timeout_ms, uint32_t poll_interval_us = 100);

    void lock() { bus_mutex_.lock(); }
    void unlock() { bus_mutex_.unlock(); }

    static int32_t decodeTwosComplement24(uint32_t raw);

    size_t channelCount() const { return config_.data_pins.size(); }
    const ChannelSetConfig& config() const { return config_; }
    GainMode gainMode() const { return gain_mode_; }
    uint8_t gainPulses() const { return gain_pulses_; }
    EngineState state() const;
    uint32_t cycleCount() const;

private:
    DigitalPort* port_ = nullptr;
    const ChannelSetConfig config_;
    GainMode gain_mode_ = GainMode::GAIN_128;
    uint8_t gain_pulses_ = 1;
    EngineState state_ = EngineState::UNINITIALIZED;
    uint32_t cycles_ = 0;
    mutable std::recursive_mutex bus_mutex_;

    void setGain(uint16_t gain);
    void powerUp();
    void pulseClock();
    void reportNotReady(const std::vector<size_t>& channels) const;
};
