#pragma once
#include "digital_port.hpp"

// DigitalPort on the Arduino core GPIO calls.
class ArduinoDigitalPort : public DigitalPort {
public:
    ArduinoDigitalPort() = default;
    ~ArduinoDigitalPort() override = default;

    void setDirection(PinId pin, PinDirection direction) override;
    void write(PinId pin, PinLevel level) override;
    PinLevel read(PinId pin) override;
    void delayMicros(uint32_t us) override;
    uint32_t millis() override;
};
