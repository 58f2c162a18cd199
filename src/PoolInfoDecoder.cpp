#include "PoolInfoDecoder.hpp"
#include <iomanip>
#include <sstream>

namespace ptt {

namespace {

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t readU64(const uint8_t* p) {
    return static_cast<uint64_t>(readU32(p))
         | (static_cast<uint64_t>(readU32(p + 4)) << 32);
}

std::string describeStatus(QueryStatus status) {
    std::ostringstream oss;
    oss << "pool tag query failed with status 0x"
        << std::hex << std::setw(8) << std::setfill('0')
        << static_cast<uint32_t>(status.code);
    return oss.str();
}

} // namespace

AcquisitionError::AcquisitionError(QueryStatus status)
    : std::runtime_error(describeStatus(status)), status_(status) {
}

std::string formatTag(const uint8_t* bytes) {
    std::string tag(4, '.');
    for (size_t i = 0; i < 4; ++i) {
        if (bytes[i] >= 32 && bytes[i] <= 126) {
            tag[i] = static_cast<char>(bytes[i]);
        }
    }
    return tag;
}

PoolInfoDecoder::PoolInfoDecoder(size_t buffer_size) : buffer_size_(buffer_size) {
}

Snapshot PoolInfoDecoder::decode(const uint8_t* data, size_t size) {
    Snapshot snapshot;
    if (data == nullptr || size < 4) {
        return snapshot;
    }

    const uint32_t count = readU32(data);
    size_t offset = kHeaderSize;

    for (uint32_t i = 0; i < count; ++i) {
        // Truncated record: keep what we have
        if (offset > size || size - offset < kRecordSize) {
            break;
        }

        const uint8_t* rec = data + offset;
        PoolTagSample sample;
        sample.tag                 = formatTag(rec);
        sample.paged_allocs        = readU32(rec + 4);
        sample.paged_frees         = readU32(rec + 8);
        sample.paged_bytes_used    = readU64(rec + 16);
        sample.nonpaged_allocs     = readU32(rec + 24);
        sample.nonpaged_frees      = readU32(rec + 28);
        sample.nonpaged_bytes_used = readU64(rec + 32);

        std::string key = sample.tag;
        snapshot[key] = std::move(sample);
        offset += kRecordSize;
    }

    return snapshot;
}

Snapshot PoolInfoDecoder::decode(const std::vector<uint8_t>& buffer) {
    return decode(buffer.data(), buffer.size());
}

Snapshot PoolInfoDecoder::acquire(PoolTagSource& source) const {
    // Scoped to this call; nothing is kept between samples
    std::vector<uint8_t> buffer(buffer_size_);
    size_t returned_length = 0;

    QueryStatus status = source.query(buffer.data(), buffer.size(), returned_length);
    if (!status.ok()) {
        throw AcquisitionError(status);
    }

    if (returned_length > buffer.size()) {
        returned_length = buffer.size();
    }
    return decode(buffer.data(), returned_length);
}

std::optional<Snapshot> PoolInfoDecoder::tryAcquire(PoolTagSource& source) const {
    try {
        return acquire(source);
    } catch (const AcquisitionError&) {
        return std::nullopt;
    }
}

} // namespace ptt
