#include "SamplingLoop.hpp"
#include "Utilities.hpp"
#include <algorithm>

namespace ptt {

const char* toString(LoopState state) {
    switch (state) {
        case LoopState::Init:             return "INIT";
        case LoopState::BaselineCaptured: return "BASELINE_CAPTURED";
        case LoopState::Sampling:         return "SAMPLING";
        case LoopState::FinalSummary:     return "FINAL_SUMMARY";
        case LoopState::Done:             return "DONE";
    }
    return "UNKNOWN";
}

SamplingLoop::SamplingLoop(const TrackerConfig& config, PoolTagSource& source,
                           std::ostream& out, std::atomic<bool>& should_stop, Sleeper sleeper)
    : config_(config),
      source_(source),
      should_stop_(should_stop),
      sleeper_(std::move(sleeper)),
      decoder_(getQueryBufferBytes()),
      store_(config.threshold_bytes),
      reporter_(out) {
    if (!sleeper_) {
        sleeper_ = [](uint32_t ms) { sleepMillis(ms); };
    }
}

void SamplingLoop::run() {
    reporter_.printBanner(config_);
    captureBaseline();

    for (uint32_t i = 1; i <= config_.sample_count; ++i) {
        if (!waitInterval()) {
            interrupted_ = true;
            break;
        }
        sampleOnce(i);
    }

    finalSummary();
    state_ = LoopState::Done;
}

bool SamplingLoop::waitInterval() {
    uint64_t remaining = static_cast<uint64_t>(config_.interval_seconds) * 1000;
    while (remaining > 0) {
        if (should_stop_.load()) return false;
        uint32_t slice = static_cast<uint32_t>(std::min<uint64_t>(remaining, kWaitSliceMs));
        sleeper_(slice);
        remaining -= slice;
    }
    return !should_stop_.load();
}

Snapshot SamplingLoop::takeSnapshot(uint64_t elapsed_seconds) {
    std::optional<Snapshot> snapshot = decoder_.tryAcquire(source_);
    if (!snapshot) {
        return Snapshot();
    }
    store_.updateLatest(*snapshot, elapsed_seconds);
    return std::move(*snapshot);
}

void SamplingLoop::captureBaseline() {
    Snapshot baseline = takeSnapshot(0);
    reporter_.printBaseline(baseline);
    store_.recordBaseline(std::move(baseline));
    state_ = LoopState::BaselineCaptured;
}

void SamplingLoop::sampleOnce(uint32_t index) {
    state_ = LoopState::Sampling;
    const uint64_t elapsed = static_cast<uint64_t>(index) * config_.interval_seconds;

    Snapshot current = takeSnapshot(elapsed);
    reporter_.printGrowthTable(elapsed, store_.computeGrowth(current), config_.top_n);
    completed_samples_ = index;
}

void SamplingLoop::finalSummary() {
    state_ = LoopState::FinalSummary;

    Snapshot final_snapshot;
    uint64_t elapsed = 0;
    if (interrupted_) {
        if (store_.latest()) {
            final_snapshot = *store_.latest();
            elapsed = store_.latestElapsedSeconds();
        }
    } else {
        elapsed = config_.totalSeconds();
        final_snapshot = takeSnapshot(elapsed);
    }

    reporter_.printFinalSummary(
        store_.computeFinalGrowth(final_snapshot, static_cast<double>(elapsed)), interrupted_);
}

} // namespace ptt
