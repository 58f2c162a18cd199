#include "Types.hpp"

namespace ptt {

// PoolTagSample Implementation
uint32_t PoolTagSample::pagedOutstanding() const {
    return paged_allocs - paged_frees;
}

uint32_t PoolTagSample::nonpagedOutstanding() const {
    return nonpaged_allocs - nonpaged_frees;
}

uint64_t PoolTagSample::totalBytesUsed() const {
    return paged_bytes_used + nonpaged_bytes_used;
}

// FinalGrowthRecord Implementation
double FinalGrowthRecord::estimatedMbPerDay() const {
    return rate_kb_per_min * 60.0 * 24.0 / 1024.0;
}

uint64_t totalBytesUsed(const Snapshot& snapshot) {
    uint64_t total = 0;
    for (const auto& entry : snapshot) {
        total += entry.second.totalBytesUsed();
    }
    return total;
}

} // namespace ptt
