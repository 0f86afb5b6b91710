#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

using PinId = uint8_t;

enum class PinLevel : uint8_t { LEVEL_LOW = 0, LEVEL_HIGH = 1 };

enum class PinDirection : uint8_t { DIR_INPUT, DIR_OUTPUT };

// One signed 24-bit reading per channel, in data pin order.
using SampleVector = std::vector<int32_t>;

// raw - offset per channel, in data pin order.
using CalibratedVector = std::vector<double>;

struct Channel {
    size_t index = 0;
    PinId data_pin = 0;
    double offset = 0.0;
};
