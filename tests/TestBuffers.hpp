// File: tests/TestBuffers.hpp
// Purpose: Build SystemPoolTagInformation-shaped buffers and a scripted pool
//          tag source for unit tests.

#pragma once

#include "PoolTagSource.hpp"

#include <cstdint>
#include <cstring>
#include <deque>
#include <string>
#include <vector>

namespace ptt::test
{

struct RawRecord
{
    std::string tag;
    uint32_t paged_allocs = 0;
    uint32_t paged_frees = 0;
    uint64_t paged_bytes = 0;
    uint32_t nonpaged_allocs = 0;
    uint32_t nonpaged_frees = 0;
    uint64_t nonpaged_bytes = 0;
};

inline void putU32(std::vector<uint8_t> &buf, size_t offset, uint32_t v)
{
    for (size_t i = 0; i < 4; ++i)
        buf[offset + i] = static_cast<uint8_t>(v >> (8 * i));
}

inline void putU64(std::vector<uint8_t> &buf, size_t offset, uint64_t v)
{
    for (size_t i = 0; i < 8; ++i)
        buf[offset + i] = static_cast<uint8_t>(v >> (8 * i));
}

/// Header count defaults to the number of records.
inline std::vector<uint8_t> makeBuffer(const std::vector<RawRecord> &records, int64_t count = -1)
{
    std::vector<uint8_t> buf(8 + records.size() * 40, 0);
    putU32(buf, 0, count < 0 ? static_cast<uint32_t>(records.size()) : static_cast<uint32_t>(count));
    size_t offset = 8;
    for (const auto &r : records)
    {
        for (size_t i = 0; i < 4 && i < r.tag.size(); ++i)
            buf[offset + i] = static_cast<uint8_t>(r.tag[i]);
        putU32(buf, offset + 4, r.paged_allocs);
        putU32(buf, offset + 8, r.paged_frees);
        putU32(buf, offset + 12, 0xDEADBEEF);
        putU64(buf, offset + 16, r.paged_bytes);
        putU32(buf, offset + 24, r.nonpaged_allocs);
        putU32(buf, offset + 28, r.nonpaged_frees);
        putU64(buf, offset + 32, r.nonpaged_bytes);
        offset += 40;
    }
    return buf;
}

/// Replays queued responses; an exhausted queue reports failure.
class ScriptedSource : public PoolTagSource
{
  public:
    struct Response
    {
        QueryStatus status;
        std::vector<uint8_t> data;
    };

    void pushBuffer(std::vector<uint8_t> data)
    {
        responses_.push_back({QueryStatus{}, std::move(data)});
    }

    void pushFailure(int32_t code = QueryStatus::kInfoLengthMismatch)
    {
        QueryStatus status;
        status.code = code;
        responses_.push_back({status, {}});
    }

    QueryStatus query(uint8_t *buffer, size_t size, size_t &returned_length) override
    {
        ++calls;
        returned_length = 0;
        if (responses_.empty())
        {
            QueryStatus status;
            status.code = QueryStatus::kNotSupported;
            return status;
        }

        Response r = std::move(responses_.front());
        responses_.pop_front();
        if (!r.status.ok())
            return r.status;
        if (r.data.size() > size)
        {
            QueryStatus status;
            status.code = QueryStatus::kInfoLengthMismatch;
            return status;
        }
        if (!r.data.empty())
            std::memcpy(buffer, r.data.data(), r.data.size());
        returned_length = r.data.size();
        return r.status;
    }

    int calls = 0;

  private:
    std::deque<Response> responses_;
};

} // namespace ptt::test
