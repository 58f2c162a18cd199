#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <ostream>

#include "LeakReporter.hpp"
#include "PoolInfoDecoder.hpp"
#include "PoolTagSource.hpp"
#include "SampleStore.hpp"
#include "TrackerConfig.hpp"

namespace ptt {

enum class LoopState {
    Init,
    BaselineCaptured,
    Sampling,
    FinalSummary,
    Done
};

const char* toString(LoopState state);

/**
 * Timed baseline / sample / final-summary driver
 *
 * Single threaded. A failed acquisition becomes an empty round and never
 * stops the run. Setting the stop flag ends sampling early; the final summary
 * is then computed from the most recent successful snapshot.
 */
class SamplingLoop {
public:
    // Defaults to sleepMillis() when empty
    using Sleeper = std::function<void(uint32_t ms)>;

    // Granularity at which the stop flag is checked while waiting
    static constexpr uint32_t kWaitSliceMs = 100;

    SamplingLoop(const TrackerConfig& config, PoolTagSource& source, std::ostream& out,
                 std::atomic<bool>& should_stop, Sleeper sleeper = nullptr);

    /**
     * Run to completion (or interruption)
     */
    void run();

    LoopState state() const { return state_; }
    const SampleStore& store() const { return store_; }
    uint32_t completedSamples() const { return completed_samples_; }
    bool interrupted() const { return interrupted_; }

private:
    // Blocks for one interval; returns false if stopped meanwhile
    bool waitInterval();

    // Empty snapshot on failure; successful ones also become the store's latest
    Snapshot takeSnapshot(uint64_t elapsed_seconds);

    void captureBaseline();
    void sampleOnce(uint32_t index);
    void finalSummary();

    const TrackerConfig& config_;
    PoolTagSource& source_;
    std::atomic<bool>& should_stop_;
    Sleeper sleeper_;

    PoolInfoDecoder decoder_;
    SampleStore store_;
    LeakReporter reporter_;

    LoopState state_ = LoopState::Init;
    uint32_t completed_samples_ = 0;
    bool interrupted_ = false;
};

} // namespace ptt
