#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "PoolTagSource.hpp"
#include "Types.hpp"

namespace ptt {

/**
 * Raised when the pool tag query reports a non-success status
 */
class AcquisitionError : public std::runtime_error {
public:
    explicit AcquisitionError(QueryStatus status);

    QueryStatus status() const { return status_; }

private:
    QueryStatus status_;
};

/**
 * Decoder for the SystemPoolTagInformation buffer
 *
 * Layout: u32 record count, 4 reserved bytes, then 40-byte records
 * (tag, paged allocs/frees, reserved, paged bytes, non-paged allocs/frees,
 * non-paged bytes), little endian. Stateless; every call stands alone.
 */
class PoolInfoDecoder {
public:
    static constexpr size_t kHeaderSize = 8;
    static constexpr size_t kRecordSize = 40;

    explicit PoolInfoDecoder(size_t buffer_size);

    /**
     * Decode a raw buffer into a snapshot
     * Stops at the first record that does not fit; later duplicates of a tag win
     */
    static Snapshot decode(const uint8_t* data, size_t size);
    static Snapshot decode(const std::vector<uint8_t>& buffer);

    /**
     * Query the source into a freshly allocated buffer and decode it
     * @throws AcquisitionError if the query reports failure
     */
    Snapshot acquire(PoolTagSource& source) const;

    /**
     * acquire() with failures mapped to std::nullopt
     */
    std::optional<Snapshot> tryAcquire(PoolTagSource& source) const;

private:
    size_t buffer_size_;
};

/**
 * Render 4 raw tag bytes as ASCII, non-printable bytes as '.'
 */
std::string formatTag(const uint8_t* bytes);

} // namespace ptt
