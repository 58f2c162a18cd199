#include "Utilities.hpp"
#include <chrono>
#include <thread>
#include <sstream>
#include <iomanip>
#include <limits>

#ifndef PTT_QUERY_BUFFER_MB
#define PTT_QUERY_BUFFER_MB 2
#endif

namespace ptt {

// Timer Implementation
Timer::Timer() : start_time_(currentTimeMillis()) {
}

uint64_t Timer::elapsedMillis() const {
    return currentTimeMillis() - start_time_;
}

// ArgParser Implementation
ArgParser::ArgParser(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

std::string ArgParser::get(size_t index, const std::string& default_value) const {
    if (index < args_.size()) {
        return args_[index];
    }
    return default_value;
}

bool ArgParser::getUnsigned(size_t index, uint32_t& value) const {
    if (!has(index)) return true;
    return parseUnsigned(args_[index], value);
}

bool parseUnsigned(const std::string& text, uint32_t& value) {
    if (text.empty()) return false;
    
    uint64_t result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        result = result * 10 + static_cast<uint64_t>(c - '0');
        if (result > std::numeric_limits<uint32_t>::max()) return false;
    }
    
    value = static_cast<uint32_t>(result);
    return true;
}

// Utility functions
uint64_t currentTimeMillis() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

void sleepMillis(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

size_t getQueryBufferBytes() {
    return static_cast<size_t>(PTT_QUERY_BUFFER_MB) * 1024 * 1024;
}

} // namespace ptt
