#include "../include/calibrator.hpp"
#include "../include/acquisition_engine.hpp"
#include "../include/calibration_set.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <cmath>
#include <mutex>
#include <string>

const size_t Calibrator::kMinSamples;
const size_t Calibrator::kMaxRejectedPercent;

Calibrator::Calibrator(AcquisitionEngine* engine, CalibrationSet* calibration)
    : engine_(engine), calibration_(calibration) {
    if (!engine_ || !calibration_) {
        throw ConfigException("Calibrator: engine and calibration set are required", ERR_CONFIG);
    }
    if (calibration_->size() != engine_->channelCount()) {
        throw ConfigException("Calibrator: calibration set has " + std::to_string(calibration_->size()) +
                              " offsets for " + std::to_string(engine_->channelCount()) + " channels",
                              ERR_CONFIG);
    }
}

TareResult Calibrator::tare(size_t sample_count, double max_deviation_factor,
                            uint32_t ready_timeout_ms, uint32_t poll_interval_us) {
    TareResult result;

    if (sample_count < kMinSamples) {
        result.status = AcquisitionStatus::INSUFFICIENT_SAMPLES;
        result.message = "Cannot tare with less than " + std::to_string(kMinSamples) + " samples";
        Logger::warn("[Tare] %s (requested %u)", result.message.c_str(), (unsigned)sample_count);
        return result;
    }
    if (!(max_deviation_factor >= 0.0)) {
        result.status = AcquisitionStatus::INVALID_ARGUMENT;
        result.message = "Deviation factor must be a non-negative number";
        Logger::warn("[Tare] %s", result.message.c_str());
        return result;
    }

    const size_t n = engine_->channelCount();
    std::vector<std::vector<int32_t>> per_channel;

    {
        // One tare owns the clock line from the first cycle to the last.
        std::lock_guard<AcquisitionEngine> bus(*engine_);
        if (!collect(sample_count, ready_timeout_ms, poll_interval_us, per_channel,
                     result.samples_collected)) {
            result.status = AcquisitionStatus::TIMEOUT;
            result.message = "Converters not ready within " + std::to_string(ready_timeout_ms) +
                             " ms after " + std::to_string(result.samples_collected) + " samples";
            Logger::warn("[Tare] %s", result.message.c_str());
            return result;
        }
    }

    result.sample_total = n * sample_count;
    result.channels.reserve(n);
    size_t empty_channels = 0;
    for (size_t ch = 0; ch < n; ch++) {
        ChannelTareStats stats = filterChannel(per_channel[ch], max_deviation_factor);
        if (stats.retained == 0) {
            Logger::warn("[Tare] Channel %u kept no samples", (unsigned)ch);
            empty_channels++;
        }
        result.retained_total += stats.retained;
        result.channels.push_back(stats);
        Logger::debug("[Tare] ch%u mean=%.2f std=%.2f kept=%u/%u", (unsigned)ch, stats.mean,
                      stats.std_dev, (unsigned)stats.retained, (unsigned)sample_count);
    }

    // Every channel needs at least one retained sample, and the discarded share
    // over all channels must stay within kMaxRejectedPercent.
    size_t rejected_total = result.sample_total - result.retained_total;
    if (empty_channels > 0) {
        result.status = AcquisitionStatus::EXCESSIVE_DEVIATION;
        result.message = "Excessive deviations measured: " + std::to_string(empty_channels) +
                         " channel(s) kept no samples";
        Logger::warn("[Tare] %s", result.message.c_str());
        return result;
    }
    if (rejected_total * 100 > result.sample_total * kMaxRejectedPercent) {
        result.status = AcquisitionStatus::EXCESSIVE_DEVIATION;
        result.message = "Excessive deviations measured: kept " + std::to_string(result.retained_total) +
                         " of " + std::to_string(result.sample_total) + " samples";
        Logger::warn("[Tare] %s", result.message.c_str());
        return result;
    }

    std::vector<double> offsets;
    offsets.reserve(n);
    for (const ChannelTareStats& stats : result.channels) {
        offsets.push_back(stats.retained_mean);
    }
    if (!calibration_->replace(offsets)) {
        result.status = AcquisitionStatus::INVALID_ARGUMENT;
        result.message = "Offset count does not match channel count";
        Logger::error("[Tare] %s", result.message.c_str());
        return result;
    }

    result.offsets = offsets;
    result.status = AcquisitionStatus::SUCCESS;
    result.message = "Tared " + std::to_string(n) + " channel(s)";
    Logger::info("[Tare] Tared, kept %u of %u samples", (unsigned)result.retained_total,
                 (unsigned)result.sample_total);
    for (size_t ch = 0; ch < n; ch++) {
        Logger::info("[Tare]   ch%u offset=%.2f", (unsigned)ch, offsets[ch]);
    }
    return result;
}

bool Calibrator::collect(size_t sample_count, uint32_t ready_timeout_ms, uint32_t poll_interval_us,
                         std::vector<std::vector<int32_t>>& per_channel, size_t& collected) {
    std::vector<SampleVector> cycles;
    cycles.reserve(sample_count);
    collected = 0;

    while (cycles.size() < sample_count) {
        if (ready_timeout_ms == 0) {
            // Unbounded busy-wait on readiness.
            if (engine_->isReady()) {
                cycles.push_back(engine_->readRaw());
                collected = cycles.size();
            }
            continue;
        }
        if (!engine_->waitReady(ready_timeout_ms, poll_interval_us)) {
            return false;
        }
        cycles.push_back(engine_->readRaw());
        collected = cycles.size();
    }

    // Cycle-major to channel-major.
    const size_t n = engine_->channelCount();
    per_channel.assign(n, std::vector<int32_t>());
    for (size_t ch = 0; ch < n; ch++) {
        per_channel[ch].reserve(cycles.size());
        for (const SampleVector& cycle : cycles) {
            per_channel[ch].push_back(cycle[ch]);
        }
    }
    return true;
}

ChannelTareStats Calibrator::filterChannel(const std::vector<int32_t>& samples,
                                           double max_deviation_factor) {
    ChannelTareStats stats;
    if (samples.empty()) return stats;

    double sum = 0.0;
    for (int32_t s : samples) sum += (double)s;
    stats.mean = sum / (double)samples.size();

    double sq_sum = 0.0;
    for (int32_t s : samples) {
        double d = (double)s - stats.mean;
        sq_sum += d * d;
    }
    stats.std_dev = std::sqrt(sq_sum / (double)samples.size());

    const double limit = max_deviation_factor * stats.std_dev;
    double kept_sum = 0.0;
    for (int32_t s : samples) {
        if (std::fabs((double)s - stats.mean) <= limit) {
            kept_sum += (double)s;
            stats.retained++;
        }
    }
    stats.retained_mean = stats.retained ? kept_sum / (double)stats.retained : stats.mean;
    return stats;
}
