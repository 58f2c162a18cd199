#pragma once

#include <cstdint>
#include <string>

#include "SampleStore.hpp"

namespace ptt {

/**
 * Configuration for a pool tag monitoring run
 * Contains the positional CLI parameters and fixed reporting settings
 */
struct TrackerConfig {
    // Timing
    uint32_t interval_seconds = 30;
    uint32_t sample_count = 20;
    
    // Reporting
    int64_t threshold_bytes = SampleStore::kDefaultThresholdBytes;  // Only surface growth strictly above this
    uint32_t top_n = 15;                   // Row cap for per-interval tables
    
    /**
     * Parse command line arguments and populate config
     * Accepts `[interval_seconds] [sample_count]`
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if parsing succeeded, false otherwise
     */
    bool parseArgs(int argc, char* argv[]);
    
    /**
     * Print usage information to stderr
     */
    void printUsage(const char* program_name) const;
    
    /**
     * Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;
    
    /**
     * Total nominal monitoring duration in seconds
     */
    uint64_t totalSeconds() const;
};

} // namespace ptt
