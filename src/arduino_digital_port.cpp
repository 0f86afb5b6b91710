#include <Arduino.h>
#include "../include/arduino_digital_port.hpp"

void ArduinoDigitalPort::setDirection(PinId pin, PinDirection direction) {
    pinMode(pin, direction == PinDirection::DIR_OUTPUT ? OUTPUT : INPUT);
}

void ArduinoDigitalPort::write(PinId pin, PinLevel level) {
    digitalWrite(pin, level == PinLevel::LEVEL_HIGH ? HIGH : LOW);
}

PinLevel ArduinoDigitalPort::read(PinId pin) {
    return digitalRead(pin) == HIGH ? PinLevel::LEVEL_HIGH : PinLevel::LEVEL_LOW;
}

void ArduinoDigitalPort::delayMicros(uint32_t us) {
    delayMicroseconds(us);
}

uint32_t ArduinoDigitalPort::millis() {
    return ::millis();
}
