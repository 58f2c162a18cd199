#include "SampleStore.hpp"
#include <algorithm>

namespace ptt {

namespace {

int64_t signedDelta(uint64_t current, uint64_t base) {
    return static_cast<int64_t>(current) - static_cast<int64_t>(base);
}

} // namespace

SampleStore::SampleStore(int64_t threshold_bytes) : threshold_bytes_(threshold_bytes) {
}

bool SampleStore::recordBaseline(Snapshot snapshot) {
    if (baseline_) {
        return false;
    }
    baseline_ = std::move(snapshot);
    return true;
}

void SampleStore::updateLatest(Snapshot snapshot, uint64_t elapsed_seconds) {
    latest_ = std::move(snapshot);
    latest_elapsed_seconds_ = elapsed_seconds;
}

const PoolTagSample* SampleStore::findBaseline(const std::string& tag) const {
    if (!baseline_) return nullptr;
    auto it = baseline_->find(tag);
    return it != baseline_->end() ? &it->second : nullptr;
}

std::vector<GrowthRecord> SampleStore::computeGrowth(const Snapshot& current) const {
    static const PoolTagSample kZero;
    std::vector<GrowthRecord> growers;

    for (const auto& entry : current) {
        const PoolTagSample& cur = entry.second;
        const PoolTagSample* found = findBaseline(entry.first);
        const PoolTagSample& base = found ? *found : kZero;

        GrowthRecord rec;
        rec.tag                  = entry.first;
        rec.delta_paged_bytes    = signedDelta(cur.paged_bytes_used, base.paged_bytes_used);
        rec.delta_nonpaged_bytes = signedDelta(cur.nonpaged_bytes_used, base.nonpaged_bytes_used);
        rec.delta_total_bytes    = rec.delta_paged_bytes + rec.delta_nonpaged_bytes;
        rec.current_total_bytes  = cur.totalBytesUsed();

        if (rec.delta_total_bytes > threshold_bytes_) {
            growers.push_back(std::move(rec));
        }
    }

    std::sort(growers.begin(), growers.end(), [](const GrowthRecord& a, const GrowthRecord& b) {
        if (a.delta_total_bytes != b.delta_total_bytes) {
            return a.delta_total_bytes > b.delta_total_bytes;
        }
        return a.tag < b.tag;
    });
    return growers;
}

std::vector<FinalGrowthRecord> SampleStore::computeFinalGrowth(const Snapshot& final_snapshot,
                                                               double elapsed_seconds) const {
    std::vector<FinalGrowthRecord> suspects;
    const double minutes = elapsed_seconds / 60.0;

    // computeGrowth() already filters and orders
    for (const GrowthRecord& growth : computeGrowth(final_snapshot)) {
        FinalGrowthRecord rec;
        rec.tag                 = growth.tag;
        rec.delta_total_bytes   = growth.delta_total_bytes;
        rec.current_total_bytes = growth.current_total_bytes;
        if (elapsed_seconds > 0.0) {
            rec.rate_kb_per_min = (static_cast<double>(growth.delta_total_bytes) / 1024.0) / minutes;
        }
        suspects.push_back(std::move(rec));
    }
    return suspects;
}

} // namespace ptt
