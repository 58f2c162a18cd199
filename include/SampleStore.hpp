#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "Types.hpp"

namespace ptt {

/**
 * Baseline and latest snapshot of a run, plus growth computation against the baseline
 *
 * The baseline is assigned once. Growth queries are pure functions of the
 * baseline and their argument; a tag missing from the baseline is treated as
 * having grown from zero.
 */
class SampleStore {
public:
    static constexpr int64_t kDefaultThresholdBytes = 100 * 1024;

    explicit SampleStore(int64_t threshold_bytes = kDefaultThresholdBytes);

    /**
     * Store the first snapshot of the run
     * @return false if a baseline already exists (it is kept unchanged)
     */
    bool recordBaseline(Snapshot snapshot);

    bool hasBaseline() const { return baseline_.has_value(); }
    const std::optional<Snapshot>& baseline() const { return baseline_; }

    /**
     * Remember the most recent successfully acquired snapshot
     */
    void updateLatest(Snapshot snapshot, uint64_t elapsed_seconds);

    const std::optional<Snapshot>& latest() const { return latest_; }
    uint64_t latestElapsedSeconds() const { return latest_elapsed_seconds_; }

    /**
     * Per-tag growth of `current` over the baseline
     * Only records with delta_total_bytes > threshold, largest first, ties by tag
     */
    std::vector<GrowthRecord> computeGrowth(const Snapshot& current) const;

    /**
     * Final ranking with growth rate over `elapsed_seconds`
     * Same filter and order as computeGrowth(); rate is 0 when elapsed_seconds <= 0
     */
    std::vector<FinalGrowthRecord> computeFinalGrowth(const Snapshot& final_snapshot,
                                                      double elapsed_seconds) const;

    int64_t thresholdBytes() const { return threshold_bytes_; }

private:
    const PoolTagSample* findBaseline(const std::string& tag) const;

    int64_t threshold_bytes_;
    std::optional<Snapshot> baseline_;
    std::optional<Snapshot> latest_;
    uint64_t latest_elapsed_seconds_ = 0;
};

} // namespace ptt
