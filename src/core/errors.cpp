#include "etf/core/errors.hpp"

namespace etf::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::Truncated: return "Truncated";
            case StatusCode::UnsupportedTag: return "UnsupportedTag";
            case StatusCode::InvalidVersion: return "InvalidVersion";
            case StatusCode::Overflow: return "Overflow";
            case StatusCode::DepthExceeded: return "DepthExceeded";
            case StatusCode::TooLarge: return "TooLarge";
            case StatusCode::OutOfMemory: return "OutOfMemory";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Term: return "Term";
        }
        return "Unknown";
    }
} // namespace etf::core
