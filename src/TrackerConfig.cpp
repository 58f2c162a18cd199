#include "TrackerConfig.hpp"
#include "Utilities.hpp"
#include <iostream>

namespace ptt {

bool TrackerConfig::parseArgs(int argc, char* argv[]) {
    ArgParser parser(argc, argv);
    
    if (parser.count() > 2) {
        std::cerr << "Error: expected at most 2 arguments, got " << parser.count() << "\n";
        return false;
    }
    
    if (!parser.getUnsigned(0, interval_seconds)) {
        std::cerr << "Error: interval_seconds must be a non-negative integer, got '"
                  << parser.get(0) << "'\n";
        return false;
    }
    
    if (!parser.getUnsigned(1, sample_count)) {
        std::cerr << "Error: sample_count must be a non-negative integer, got '"
                  << parser.get(1) << "'\n";
        return false;
    }
    
    // Validate configuration
    if (!validate()) {
        return false;
    }
    
    return true;
}

void TrackerConfig::printUsage(const char* program_name) const {
    std::cerr << "Usage: " << program_name << " [interval_seconds] [sample_count]\n";
    std::cerr << "\nArguments:\n";
    std::cerr << "  interval_seconds   Seconds between samples (default: " << interval_seconds << ")\n";
    std::cerr << "  sample_count       Number of samples after the baseline (default: " << sample_count << ")\n";
}

bool TrackerConfig::validate() const {
    if (interval_seconds == 0) {
        std::cerr << "Error: interval_seconds must be > 0\n";
        return false;
    }
    
    if (sample_count == 0) {
        std::cerr << "Error: sample_count must be > 0\n";
        return false;
    }
    
    if (threshold_bytes < 0) {
        std::cerr << "Error: threshold must be >= 0\n";
        return false;
    }
    
    if (top_n == 0) {
        std::cerr << "Error: top_n must be > 0\n";
        return false;
    }
    
    return true;
}

uint64_t TrackerConfig::totalSeconds() const {
    return static_cast<uint64_t>(interval_seconds) * sample_count;
}

} // namespace ptt
