#include "PoolTagSource.hpp"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace ptt {

namespace {

#ifdef _WIN32

// SystemPoolTagInformation
constexpr ULONG kSystemPoolTagInformation = 22;

using NtQuerySystemInformationFn = LONG(WINAPI*)(ULONG, PVOID, ULONG, PULONG);

class NtPoolTagSource : public PoolTagSource {
public:
    NtPoolTagSource() {
        HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
        if (ntdll) {
            query_ = reinterpret_cast<NtQuerySystemInformationFn>(
                GetProcAddress(ntdll, "NtQuerySystemInformation"));
        }
    }

    QueryStatus query(uint8_t* buffer, size_t size, size_t& returned_length) override {
        returned_length = 0;
        QueryStatus status;
        if (!query_) {
            status.code = QueryStatus::kNotSupported;
            return status;
        }

        ULONG written = 0;
        status.code = query_(kSystemPoolTagInformation, buffer, static_cast<ULONG>(size), &written);
        if (status.ok()) {
            returned_length = written;
        }
        return status;
    }

private:
    NtQuerySystemInformationFn query_ = nullptr;
};

#else

class UnsupportedPoolTagSource : public PoolTagSource {
public:
    QueryStatus query(uint8_t* /*buffer*/, size_t /*size*/, size_t& returned_length) override {
        returned_length = 0;
        QueryStatus status;
        status.code = QueryStatus::kNotSupported;
        return status;
    }
};

#endif

} // namespace

std::unique_ptr<PoolTagSource> createSystemPoolTagSource() {
#ifdef _WIN32
    return std::make_unique<NtPoolTagSource>();
#else
    return std::make_unique<UnsupportedPoolTagSource>();
#endif
}

} // namespace ptt
