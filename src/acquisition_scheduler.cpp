#include <Arduino.h>
#include "../include/acquisition_scheduler.hpp"
#include "../include/calibrated_reader.hpp"
#include "../include/csv_row.hpp"
#include "../include/data_storage.hpp"
#include "../include/logger.hpp"

AcquisitionScheduler::AcquisitionScheduler(CalibratedReader* reader, DataStorage* storage)
    : reader_(reader), storage_(storage) {}

AcquisitionScheduler::~AcquisitionScheduler() { end(); }

void AcquisitionScheduler::begin(uint32_t interval_ms, uint32_t ready_timeout_ms) {
    pollInterval_ = interval_ms;
    readyTimeout_ = ready_timeout_ms;
    lastPoll_ = lastPrint_ = millis();
    running_ = pollInterval_ > 0 && reader_ != nullptr;
}

void AcquisitionScheduler::end() {
    running_ = false;
}

void AcquisitionScheduler::updateInterval(uint32_t interval_ms) {
    if (pollInterval_ != interval_ms) {
        pollInterval_ = interval_ms;
        Logger::info("[Scheduler] Polling interval now %u ms", (unsigned)pollInterval_);
    }
}

void AcquisitionScheduler::loop() {
    if (!running_) return;
    uint32_t now = millis();
    if ((uint32_t)(now - lastPoll_) >= pollInterval_) {
        lastPoll_ = now;
        pollTask();
    }
    if ((uint32_t)(now - lastPrint_) >= printInterval_) {
        lastPrint_ = now;
        printTask();
    }
}

void AcquisitionScheduler::pollTask() {
    ReadResult result = reader_->readWithin(readyTimeout_);
    if (result.status != AcquisitionStatus::SUCCESS) {
        // Converter not done yet; try again on the next tick
        notReady_++;
        return;
    }
    reads_++;
    if (storage_ && !storage_->appendRow(result.values)) {
        storageErrors_++;
    }
    recentSamples_.push_back(result.values);
    if (recentSamples_.size() > 10) {
        recentSamples_.erase(recentSamples_.begin());
    }
}

void AcquisitionScheduler::printTask() {
    if (recentSamples_.empty()) return;
    Logger::info("=== Recent readings ===");
    for (const auto& sample : recentSamples_) {
        Logger::info("%s", formatCsvRow(sample).c_str());
    }
    Logger::info("=== End readings ===");
    recentSamples_.clear();
}

void AcquisitionScheduler::getStatistics(char* outBuf, size_t outBufSize) const {
    snprintf(outBuf, outBufSize, "interval=%lu, reads=%lu, not_ready=%lu, storage_errors=%lu, running=%d",
             (unsigned long)pollInterval_, (unsigned long)reads_, (unsigned long)notReady_,
             (unsigned long)storageErrors_, running_);
}
