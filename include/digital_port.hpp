#pragma once
#include <stdint.h>
#include "types.hpp"

/**
 * @brief Platform GPIO and timing primitives used by the acquisition engine
 *
 * Implementations must not read pins configured as outputs or drive pins
 * configured as inputs. All calls block until the underlying I/O returns.
 */
class DigitalPort {
public:
    virtual ~DigitalPort() = default;

    virtual void setDirection(PinId pin, PinDirection direction) = 0;
    virtual void write(PinId pin, PinLevel level) = 0;
    virtual PinLevel read(PinId pin) = 0;

    // Busy delay, used for the clock pulse width floor and poll back-off.
    virtual void delayMicros(uint32_t us) = 0;

    // Free-running millisecond tick (wraps at 2^32).
    virtual uint32_t millis() = 0;
};
