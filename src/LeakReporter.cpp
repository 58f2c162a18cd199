#include "LeakReporter.hpp"
#include "Utilities.hpp"
#include <iomanip>
#include <sstream>
#include <string>

namespace ptt {

namespace {

constexpr double kKB = 1024.0;
constexpr double kMB = 1024.0 * 1024.0;

} // namespace

void LeakReporter::printBanner(const TrackerConfig& config) {
    out_ << "Sampling pool tags every " << config.interval_seconds << "s for "
         << config.sample_count << " samples (" << config.totalSeconds() << "s total)\n";
    out_ << "Will show tags that grow by >= " << config.threshold_bytes / 1024
         << " KB between first and last sample\n";
    out_ << "\n";
}

void LeakReporter::printBaseline(const Snapshot& baseline) {
    out_ << "[0s] Baseline captured: " << baseline.size() << " tags";
    if (!baseline.empty()) {
        out_ << " (" << formatBytes(totalBytesUsed(baseline)) << " in use)";
    }
    out_ << std::endl;
}

void LeakReporter::printGrowthTable(uint64_t elapsed_seconds,
                                    const std::vector<GrowthRecord>& growers,
                                    size_t max_rows) {
    out_ << "\n[" << elapsed_seconds << "s] Tags growing since baseline:\n";
    if (growers.empty()) {
        out_ << "  (none exceeding threshold)" << std::endl;
        return;
    }

    out_ << "  " << std::setw(6) << "Tag"
         << "  " << std::setw(10) << "Delta_KB"
         << "  " << std::setw(12) << "D_Paged_KB"
         << "  " << std::setw(10) << "D_NP_KB"
         << "  " << std::setw(10) << "Total_MB" << "\n";
    out_ << "  " << std::string(54, '-') << "\n";

    // Rows go through a local stream so the caller's formatting is untouched
    std::ostringstream table;
    table << std::fixed << std::setprecision(1);
    size_t rows = 0;
    for (const auto& g : growers) {
        if (rows++ >= max_rows) break;
        table << "  " << std::setw(6) << g.tag
             << "  " << std::setw(10) << g.delta_total_bytes / kKB
             << "  " << std::setw(12) << g.delta_paged_bytes / kKB
             << "  " << std::setw(10) << g.delta_nonpaged_bytes / kKB
             << "  " << std::setw(10) << g.current_total_bytes / kMB << "\n";
    }
    out_ << table.str();
    out_.flush();
}

void LeakReporter::printFinalSummary(const std::vector<FinalGrowthRecord>& suspects,
                                     bool interrupted) {
    out_ << "\n" << std::string(60, '=') << "\n";
    out_ << "FINAL SUMMARY - Monotonic growers (leak suspects)\n";
    out_ << std::string(60, '=') << "\n";
    if (interrupted) {
        out_ << "(interrupted; using the most recent successful sample)\n";
    }

    if (suspects.empty()) {
        out_ << "No tags grew significantly during the monitoring period.\n";
        out_ << "Try a longer monitoring period or use the system more actively." << std::endl;
        return;
    }

    out_ << "  " << std::setw(6) << "Tag"
         << "  " << std::setw(10) << "Growth_KB"
         << "  " << std::setw(12) << "Rate_KB/min"
         << "  " << std::setw(12) << "Current_MB"
         << "  " << std::setw(12) << "Est_MB/day" << "\n";
    out_ << "  " << std::string(62, '-') << "\n";

    std::ostringstream table;
    table << std::fixed << std::setprecision(1);
    for (const auto& s : suspects) {
        table << "  " << std::setw(6) << s.tag
             << "  " << std::setw(10) << s.delta_total_bytes / kKB
             << "  " << std::setw(12) << s.rate_kb_per_min
             << "  " << std::setw(12) << s.current_total_bytes / kMB
             << "  " << std::setw(12) << s.estimatedMbPerDay() << "\n";
    }
    out_ << table.str();
    out_.flush();
}

} // namespace ptt
