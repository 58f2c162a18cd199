#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "TrackerConfig.hpp"
#include "Types.hpp"

namespace ptt {

/**
 * Plain text rendering of a monitoring run
 */
class LeakReporter {
public:
    explicit LeakReporter(std::ostream& out) : out_(out) {}

    void printBanner(const TrackerConfig& config);

    void printBaseline(const Snapshot& baseline);

    /**
     * Per-interval growth table, at most `max_rows` rows
     */
    void printGrowthTable(uint64_t elapsed_seconds, const std::vector<GrowthRecord>& growers,
                          size_t max_rows);

    /**
     * Final leak suspect table, uncapped
     */
    void printFinalSummary(const std::vector<FinalGrowthRecord>& suspects, bool interrupted);

private:
    std::ostream& out_;
};

} // namespace ptt
