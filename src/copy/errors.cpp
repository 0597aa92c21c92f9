#include "dcp/copy/errors.hpp"

#include <sstream>

namespace dcp::copy {

const char* to_string(CopyErrorKind kind) noexcept {
    switch (kind) {
        case CopyErrorKind::ReadFailure: return "ReadFailure";
        case CopyErrorKind::WriteFailure: return "WriteFailure";
        case CopyErrorKind::LengthMismatch: return "LengthMismatch";
        case CopyErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case CopyErrorKind::PromotionFailure: return "PromotionFailure";
    }
    return "Unknown";
}

std::string CopyError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << " during " << step;
    if (!source.empty()) {
        oss << " source=" << source.string();
    }
    if (!target.empty()) {
        oss << " target=" << target.string();
    }
    if (!temp.empty()) {
        oss << " temp=" << temp.string();
    }
    if (!cause.empty()) {
        oss << ": " << cause;
    }
    return oss.str();
}

CopyError make_copy_error(CopyErrorKind kind, std::string step, std::string cause) {
    CopyError error;
    error.kind = kind;
    error.step = std::move(step);
    error.cause = std::move(cause);
    return error;
}

bool is_retriable(const CopyError& error) noexcept {
    return error.kind == CopyErrorKind::ReadFailure;
}

} // namespace dcp::copy
