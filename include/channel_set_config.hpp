#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "types.hpp"

// Channel A gain. The HX711 latches the gain for the next conversion from the
// number of clock pulses that follow the 24 data bits.
enum class GainMode : uint8_t {
    GAIN_128,   // 25 pulses total
    GAIN_64     // 27 pulses total
};

const size_t kMaxChannels = 16;

struct ChannelSetConfig {
    PinId clock_pin = 0;
    std::vector<PinId> data_pins;   // one per channel, defines channel order
    uint16_t gain = 128;
    bool debug = false;
    uint32_t pulse_width_us = 1;
};

// Maps a numeric gain (128 or 64) to its mode. Returns false for anything else.
bool gainModeFromValue(uint16_t gain, GainMode& mode);

// Extra clock pulses issued after the 24 data bits.
uint8_t gainPulseCount(GainMode mode);

uint16_t gainModeValue(GainMode mode);

bool validateChannelSetConfig(const ChannelSetConfig& config, std::string& reason);
