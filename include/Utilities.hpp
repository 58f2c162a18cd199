#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ptt {

/**
 * Simple timing utilities
 */
class Timer {
public:
    Timer();
    
    /**
     * Get elapsed time in milliseconds
     */
    uint64_t elapsedMillis() const;

private:
    uint64_t start_time_;
};

/**
 * Access to positional command line arguments (argv[0] excluded)
 */
class ArgParser {
public:
    explicit ArgParser(int argc, char* argv[]);
    
    /**
     * Number of positional arguments
     */
    size_t count() const { return args_.size(); }
    
    /**
     * Check if positional argument exists
     */
    bool has(size_t index) const { return index < args_.size(); }
    
    /**
     * Get positional argument, with default
     */
    std::string get(size_t index, const std::string& default_value = "") const;
    
    /**
     * Parse positional argument as a non-negative integer
     * @param index Position of the argument
     * @param value Receives the parsed value; left untouched when the argument is absent
     * @return false if the argument is present but not a valid non-negative integer
     */
    bool getUnsigned(size_t index, uint32_t& value) const;

private:
    std::vector<std::string> args_;
};

/**
 * Strict decimal parse; rejects signs, whitespace, trailing text and overflow
 */
bool parseUnsigned(const std::string& text, uint32_t& value);

/**
 * Get current time in milliseconds since epoch
 */
uint64_t currentTimeMillis();

/**
 * Sleep for specified milliseconds
 */
void sleepMillis(uint32_t ms);

/**
 * Format bytes into human readable string
 */
std::string formatBytes(uint64_t bytes);

/**
 * Size of the pool tag query buffer in bytes, based on PTT_QUERY_BUFFER_MB
 */
size_t getQueryBufferBytes();

} // namespace ptt
