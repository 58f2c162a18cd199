#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace ptt {

/**
 * One pool tag accounting row decoded from the OS buffer
 * Counters are opaque; the 32-bit alloc/free counts may wrap on long uptimes
 */
struct PoolTagSample {
    std::string tag;

    uint32_t paged_allocs = 0;
    uint32_t paged_frees = 0;
    uint64_t paged_bytes_used = 0;

    uint32_t nonpaged_allocs = 0;
    uint32_t nonpaged_frees = 0;
    uint64_t nonpaged_bytes_used = 0;

    /**
     * Outstanding paged allocations (allocs - frees, modulo 2^32)
     */
    uint32_t pagedOutstanding() const;

    /**
     * Outstanding non-paged allocations (allocs - frees, modulo 2^32)
     */
    uint32_t nonpagedOutstanding() const;

    /**
     * Paged plus non-paged bytes attributed to this tag
     */
    uint64_t totalBytesUsed() const;
};

/**
 * Point-in-time mapping from tag to sample, keys unique
 */
using Snapshot = std::map<std::string, PoolTagSample>;

/**
 * Growth of one tag relative to the baseline
 */
struct GrowthRecord {
    std::string tag;
    int64_t delta_paged_bytes = 0;
    int64_t delta_nonpaged_bytes = 0;
    int64_t delta_total_bytes = 0;
    uint64_t current_total_bytes = 0;
};

/**
 * Final-summary row: total growth plus the rate it implies
 */
struct FinalGrowthRecord {
    std::string tag;
    int64_t delta_total_bytes = 0;
    double rate_kb_per_min = 0.0;
    uint64_t current_total_bytes = 0;

    /**
     * Extrapolated growth in MB per day
     */
    double estimatedMbPerDay() const;
};

/**
 * Total bytes across every tag of a snapshot
 */
uint64_t totalBytesUsed(const Snapshot& snapshot);

} // namespace ptt
