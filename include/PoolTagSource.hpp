#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace ptt {

/**
 * Raw status of one pool tag query, in the OS's own encoding (NTSTATUS on Windows)
 */
struct QueryStatus {
    int32_t code = 0;

    bool ok() const { return code == 0; }

    static constexpr int32_t kInfoLengthMismatch = static_cast<int32_t>(0xC0000004);
    static constexpr int32_t kNotSupported = static_cast<int32_t>(0xC00000BB);
};

/**
 * Provider of the "all pool tag info" system query
 *
 * query() fills a caller-owned buffer and reports how many bytes it wrote.
 * Implementations keep no per-query state; a failing status means the buffer
 * contents are undefined and must not be decoded.
 */
class PoolTagSource {
public:
    virtual ~PoolTagSource() = default;

    virtual QueryStatus query(uint8_t* buffer, size_t size, size_t& returned_length) = 0;
};

/**
 * Source backed by the running kernel
 * On platforms without pool tag accounting every query reports kNotSupported
 */
std::unique_ptr<PoolTagSource> createSystemPoolTagSource();

} // namespace ptt
