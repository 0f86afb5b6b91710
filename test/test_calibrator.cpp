/**
 * Tare tests: sample count floor, per-channel outlier rejection, the
 * aggregate rejection gate and replace-on-success of the offsets.
 */

#include <cmath>
#include "acquisition_engine.hpp"
#include "calibration_set.hpp"
#include "calibrator.hpp"
#include "fake_digital_port.hpp"
#include "test_harness.hpp"

static const PinId kClock = 4;

static ChannelSetConfig makeConfig(size_t channels) {
    ChannelSetConfig config;
    config.clock_pin = kClock;
    for (size_t i = 0; i < channels; i++) config.data_pins.push_back((PinId)(16 + i));
    return config;
}

// 24-bit two's complement word for a signed reading
static uint32_t word(int32_t value) {
    return (uint32_t)value & 0xFFFFFFu;
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

/**
 * TEST 1: Fewer than 100 samples is refused without touching pins
 */
bool test_insufficient_samples() {
    printTestHeader("TEST 1: Fewer than 100 samples is refused");
    ChannelSetConfig config = makeConfig(2);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(2);
    Calibrator calibrator(&engine, &calibration);

    port.queueConstant({word(10), word(20)}, 200);
    port.resetCounters();
    TareResult result = calibrator.tare(50, 2.0);

    if (result.status != AcquisitionStatus::INSUFFICIENT_SAMPLES) return fail("result.status == AcquisitionStatus::INSUFFICIENT_SAMPLES");
    if (!(port.reads() == 0 && port.writes() == 0)) return fail("port.reads() == 0 && port.writes() == 0");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    if (!(calibration.offset(0) == 0.0 && calibration.offset(1) == 0.0)) return fail("calibration.offset(0) == 0.0 && calibration.offset(1) == 0.0");
    return true;
}

/**
 * TEST 2: Constant input tares to that constant
 */
bool test_zero_variance_sets_offset() {
    printTestHeader("TEST 2: Constant input tares to that constant");
    ChannelSetConfig config = makeConfig(3);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(3);
    Calibrator calibrator(&engine, &calibration);

    port.queueConstant({word(12345), word(-500), word(0)}, 100);
    TareResult result = calibrator.tare(100, 0.0);

    if (result.status != AcquisitionStatus::SUCCESS) return fail("result.status == AcquisitionStatus::SUCCESS");
    if (result.samples_collected != 100) return fail("result.samples_collected == 100");
    if (!(result.retained_total == 300 && result.sample_total == 300)) return fail("result.retained_total == 300 && result.sample_total == 300");
    if (!calibration.isCalibrated()) return fail("calibration.isCalibrated()");
    if (calibration.offset(0) != 12345.0) return fail("calibration.offset(0) == 12345.0");
    if (calibration.offset(1) != -500.0) return fail("calibration.offset(1) == -500.0");
    if (calibration.offset(2) != 0.0) return fail("calibration.offset(2) == 0.0");
    if (result.offsets != calibration.offsets()) return fail("result.offsets == calibration.offsets()");
    return true;
}

/**
 * TEST 3: Outliers are rejected per channel, not per cycle
 */
bool test_rejection_is_per_channel() {
    printTestHeader("TEST 3: Outliers are rejected per channel");
    ChannelSetConfig config = makeConfig(2);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(2);
    Calibrator calibrator(&engine, &calibration);

    // Channel 0 spikes in cycles 0-4, channel 1 in cycles 50-54
    for (int i = 0; i < 100; i++) {
        int32_t ch0 = (i < 5) ? 1000000 : 1000;
        int32_t ch1 = (i >= 50 && i < 55) ? -2000000 : -3000;
        port.queueConversion({word(ch0), word(ch1)});
    }
    TareResult result = calibrator.tare(100, 2.0);

    if (result.status != AcquisitionStatus::SUCCESS) return fail("result.status == AcquisitionStatus::SUCCESS");
    if (result.channels.size() != 2) return fail("result.channels.size() == 2");
    if (result.channels[0].retained != 95) return fail("result.channels[0].retained == 95");
    if (result.channels[1].retained != 95) return fail("result.channels[1].retained == 95");
    if (!near(calibration.offset(0), 1000.0)) return fail("near(calibration.offset(0), 1000.0)");
    if (!near(calibration.offset(1), -3000.0)) return fail("near(calibration.offset(1), -3000.0)");
    return true;
}

/**
 * TEST 4: Zero deviation factor keeps only exact-mean samples
 */
bool test_zero_factor_fails_noisy_channel() {
    printTestHeader("TEST 4: Zero deviation factor keeps only exact-mean samples");
    ChannelSetConfig config = makeConfig(2);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(2);
    Calibrator calibrator(&engine, &calibration);

    // First a good tare so there is something to preserve
    port.queueConstant({word(700), word(800)}, 100);
    if (calibrator.tare(100, 0.0).status != AcquisitionStatus::SUCCESS) return fail("calibrator.tare(100, 0.0).status == AcquisitionStatus::SUCCESS");

    // Channel 1 alternates 10/12: its mean (11) is never sampled
    for (int i = 0; i < 100; i++) {
        port.queueConversion({word(5), word((i % 2) ? 12 : 10)});
    }
    TareResult result = calibrator.tare(100, 0.0);

    if (result.status != AcquisitionStatus::EXCESSIVE_DEVIATION) return fail("result.status == AcquisitionStatus::EXCESSIVE_DEVIATION");
    if (result.channels[0].retained != 100) return fail("result.channels[0].retained == 100");
    if (result.channels[1].retained != 0) return fail("result.channels[1].retained == 0");
    if (!(result.retained_total == 100 && result.sample_total == 200)) return fail("result.retained_total == 100 && result.sample_total == 200");
    if (!result.offsets.empty()) return fail("result.offsets.empty()");
    if (calibration.offset(0) != 700.0) return fail("calibration.offset(0) == 700.0");
    if (calibration.offset(1) != 800.0) return fail("calibration.offset(1) == 800.0");
    return true;
}

/**
 * TEST 5: The 20% gate counts samples over all channels
 */
bool test_rejection_gate_boundary() {
    printTestHeader("TEST 5: The 20% gate counts samples over all channels");
    ChannelSetConfig config = makeConfig(1);

    // 80 zeros and 20 hundreds: mean 20, std 40, factor 1 drops the hundreds
    {
        FakeDigitalPort port(kClock, config.data_pins);
        AcquisitionEngine engine(&port, config);
        engine.begin();
        CalibrationSet calibration(1);
        Calibrator calibrator(&engine, &calibration);
        for (int i = 0; i < 100; i++) port.queueConversion({word(i < 80 ? 0 : 100)});
        TareResult result = calibrator.tare(100, 1.0);
        if (result.status != AcquisitionStatus::SUCCESS) return fail("result.status == AcquisitionStatus::SUCCESS");
        if (result.retained_total != 80) return fail("result.retained_total == 80");
        if (!near(result.channels[0].mean, 20.0)) return fail("near(result.channels[0].mean, 20.0)");
        if (!near(result.channels[0].std_dev, 40.0)) return fail("near(result.channels[0].std_dev, 40.0)");
        if (calibration.offset(0) != 0.0) return fail("calibration.offset(0) == 0.0");
        if (!calibration.isCalibrated()) return fail("calibration.isCalibrated()");
    }

    // 79 zeros and 21 hundreds: 21% discarded
    {
        FakeDigitalPort port(kClock, config.data_pins);
        AcquisitionEngine engine(&port, config);
        engine.begin();
        CalibrationSet calibration(1);
        Calibrator calibrator(&engine, &calibration);
        for (int i = 0; i < 100; i++) port.queueConversion({word(i < 79 ? 0 : 100)});
        TareResult result = calibrator.tare(100, 1.0);
        if (result.status != AcquisitionStatus::EXCESSIVE_DEVIATION) return fail("result.status == AcquisitionStatus::EXCESSIVE_DEVIATION");
        if (result.retained_total != 79) return fail("result.retained_total == 79");
        if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    }
    return true;
}

/**
 * TEST 6: Bounded tare times out and keeps the old offsets
 */
bool test_bounded_tare_timeout() {
    printTestHeader("TEST 6: Bounded tare times out and keeps the old offsets");
    ChannelSetConfig config = makeConfig(2);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(2);
    Calibrator calibrator(&engine, &calibration);

    TareResult result = calibrator.tare(100, 2.0, 300);
    if (result.status != AcquisitionStatus::TIMEOUT) return fail("result.status == AcquisitionStatus::TIMEOUT");
    if (result.samples_collected != 0) return fail("result.samples_collected == 0");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");

    // Converters stall part way through
    port.queueConstant({word(1), word(2)}, 30);
    result = calibrator.tare(100, 2.0, 300);
    if (result.status != AcquisitionStatus::TIMEOUT) return fail("result.status == AcquisitionStatus::TIMEOUT");
    if (result.samples_collected != 30) return fail("result.samples_collected == 30");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    if (calibration.offset(0) != 0.0) return fail("calibration.offset(0) == 0.0");
    return true;
}

/**
 * TEST 7: Negative deviation factor is refused
 */
bool test_negative_factor() {
    printTestHeader("TEST 7: Negative deviation factor is refused");
    ChannelSetConfig config = makeConfig(1);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(1);
    Calibrator calibrator(&engine, &calibration);

    port.queueConstant({word(3)}, 100);
    port.resetCounters();
    TareResult result = calibrator.tare(100, -1.0);
    if (result.status != AcquisitionStatus::INVALID_ARGUMENT) return fail("result.status == AcquisitionStatus::INVALID_ARGUMENT");
    if (port.reads() != 0) return fail("port.reads() == 0");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    return true;
}

/**
 * TEST 8: Channel filter statistics
 */
bool test_filter_channel_stats() {
    printTestHeader("TEST 8: Channel filter statistics");
    std::vector<int32_t> samples = {2, 4, 4, 4, 5, 5, 7, 9};
    ChannelTareStats stats = Calibrator::filterChannel(samples, 1.0);
    if (!near(stats.mean, 5.0)) return fail("near(stats.mean, 5.0)");
    if (!near(stats.std_dev, 2.0)) return fail("near(stats.std_dev, 2.0)");
    if (stats.retained != 6) return fail("stats.retained == 6");
    if (!near(stats.retained_mean, 29.0 / 6.0)) return fail("near(stats.retained_mean, 29.0 / 6.0)");

    ChannelTareStats empty = Calibrator::filterChannel(std::vector<int32_t>(), 1.0);
    if (empty.retained != 0) return fail("empty.retained == 0");
    return true;
}

/**
 * TEST 9: Calibration set only takes a full set of offsets
 */
bool test_calibration_set_replace() {
    printTestHeader("TEST 9: Calibration set only takes a full set of offsets");
    CalibrationSet calibration(3);
    if (calibration.size() != 3) return fail("calibration.size() == 3");
    if (calibration.replace({1.0, 2.0})) return fail("!calibration.replace({1.0, 2.0})");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    if (!calibration.replace({1.0, 2.0, 3.5})) return fail("calibration.replace({1.0, 2.0, 3.5})");
    if (!calibration.isCalibrated()) return fail("calibration.isCalibrated()");
    if (calibration.offset(2) != 3.5) return fail("calibration.offset(2) == 3.5");
    if (calibration.offset(7) != 0.0) return fail("calibration.offset(7) == 0.0");
    return true;
}

/**
 * TEST 10: A channel with nothing retained fails the tare
 */
bool test_empty_channel_fails_tare() {
    printTestHeader("TEST 10: A channel with nothing retained fails the tare");
    ChannelSetConfig config = makeConfig(5);
    FakeDigitalPort port(kClock, config.data_pins);
    AcquisitionEngine engine(&port, config);
    engine.begin();
    CalibrationSet calibration(5);
    Calibrator calibrator(&engine, &calibration);

    // Four steady channels and one alternating 10/12: exactly 20% discarded
    for (int i = 0; i < 100; i++) {
        port.queueConversion({word(1), word(2), word(3), word(4), word((i % 2) ? 12 : 10)});
    }
    TareResult result = calibrator.tare(100, 0.0);

    if (result.status != AcquisitionStatus::EXCESSIVE_DEVIATION) return fail("empty channel was accepted");
    if (result.channels.size() != 5) return fail("result.channels.size() == 5");
    if (result.channels[4].retained != 0) return fail("result.channels[4].retained == 0");
    if (result.retained_total != 400 || result.sample_total != 500) return fail("retained 400 of 500");
    if (!result.offsets.empty()) return fail("result.offsets.empty()");
    if (calibration.isCalibrated()) return fail("!calibration.isCalibrated()");
    for (size_t ch = 0; ch < 5; ch++) {
        if (calibration.offset(ch) != 0.0) return fail("offsets stayed at zero");
    }
    return true;
}

int main() {
    printf("\n========== CALIBRATOR TESTS ==========\n");
    printTestResult("Fewer than 100 samples is refused", test_insufficient_samples());
    printTestResult("Constant input tares to that constant", test_zero_variance_sets_offset());
    printTestResult("Outliers are rejected per channel", test_rejection_is_per_channel());
    printTestResult("Zero deviation factor keeps only exact-mean samples", test_zero_factor_fails_noisy_channel());
    printTestResult("The 20% gate counts samples over all channels", test_rejection_gate_boundary());
    printTestResult("Bounded tare times out and keeps the old offsets", test_bounded_tare_timeout());
    printTestResult("Negative deviation factor is refused", test_negative_factor());
    printTestResult("Channel filter statistics", test_filter_channel_stats());
    printTestResult("Calibration set only takes a full set of offsets", test_calibration_set_replace());
    printTestResult("A channel with nothing retained fails the tare", test_empty_channel_fails_tare());
    return printSummary();
}
