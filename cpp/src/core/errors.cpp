#include "sluice/core/errors.hpp"

#include <cstdio>
#include <cstdlib>

namespace sluice::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::Exists: return "Exists";
            case StatusCode::Io: return "Io";
            case StatusCode::ShortTransfer: return "ShortTransfer";
            case StatusCode::Closed: return "Closed";
            case StatusCode::EndOfStream: return "EndOfStream";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Pipe: return "Pipe";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Upload: return "Upload";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    void fatal(const char* what) noexcept {
        std::fprintf(stderr, "fatal: %s\n", what);
        std::fflush(stderr);
        std::abort();
    }
} // namespace sluice::core
